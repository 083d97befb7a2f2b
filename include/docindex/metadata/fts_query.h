#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace docindex::metadata {

/**
 * @brief Split a free-text query into tokens that are safe inside an FTS5 expression.
 *
 * Whitespace separates tokens. Any byte that is not alphanumeric, '_' or part of a
 * multi-byte UTF-8 sequence is treated as a separator, so operators, quotes,
 * brackets, column filters and hyphens never reach the FTS5 parser.
 */
std::vector<std::string> tokenizeFtsQuery(std::string_view query);

/**
 * @brief Build an OR-combined prefix query, e.g. `"api"* OR "auth"*`.
 *
 * Returns an empty string when no token survives; callers treat that as match-all.
 */
std::string buildFtsQuery(std::string_view query);

} // namespace docindex::metadata

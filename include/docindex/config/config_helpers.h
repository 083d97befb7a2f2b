#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace docindex::config {

/// "~" and "~/..." are resolved against $HOME; anything else is returned as-is
std::filesystem::path expand_tilde(const std::string& path);

/// Value of an environment variable, or nullopt when unset or empty
std::optional<std::string> env_value(const char* name);

/// Accepts true/false, yes/no, on/off and 1/0 in any case
std::optional<bool> parse_bool(std::string value);

/**
 * @brief Read one scalar from a TOML-style config file
 *
 * Only the flat subset the indexer writes is understood: "[section]" headers,
 * "key = value" lines, dotted "section.key = value" at any level, quoted or bare
 * values and trailing '#' comments. Returns an empty string when the file,
 * section or key is missing.
 */
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/**
 * Config file location, first match wins:
 *   override_path, $DOCINDEX_CONFIG, $XDG_CONFIG_HOME/docindex/config.toml,
 *   ~/.config/docindex/config.toml
 */
std::filesystem::path get_config_path(const std::string& override_path = "");

/// $XDG_DATA_HOME/docindex, ~/.local/share/docindex, else ./docindex_data
std::filesystem::path get_data_dir();

/// $DOCINDEX_DATA_DIR, then core.data_dir from the config file, then get_data_dir()
std::filesystem::path resolve_data_dir_from_config(const std::filesystem::path& config_path = {});

} // namespace docindex::config

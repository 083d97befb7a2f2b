#include <cctype>
#include <docindex/metadata/fts_query.h>

namespace docindex::metadata {

namespace {

bool isTokenByte(unsigned char c) {
    return std::isalnum(c) || c == '_' || c >= 0x80;
}

} // namespace

std::vector<std::string> tokenizeFtsQuery(std::string_view query) {
    std::vector<std::string> tokens;
    std::string current;
    for (char ch : query) {
        auto c = static_cast<unsigned char>(ch);
        if (isTokenByte(c)) {
            current.push_back(ch);
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

std::string buildFtsQuery(std::string_view query) {
    std::string fts;
    for (const auto& token : tokenizeFtsQuery(query)) {
        if (!fts.empty()) {
            fts += " OR ";
        }
        // Quoted so that tokens like AND/OR/NOT stay literal
        fts += '"';
        fts += token;
        fts += "\"*";
    }
    return fts;
}

} // namespace docindex::metadata

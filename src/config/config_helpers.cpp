#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <string_view>
#include <docindex/common/pattern_utils.h>
#include <docindex/config/config_helpers.h>

namespace docindex::config {

namespace fs = std::filesystem;

namespace {

bool isQuote(char c) {
    return c == '"' || c == '\'';
}

// Cuts a trailing comment, keeping '#' characters inside a quoted value
std::string_view stripComment(std::string_view value) {
    if (!value.empty() && isQuote(value.front())) {
        if (auto close = value.find(value.front(), 1); close != std::string_view::npos)
            return value.substr(0, close + 1);
        return value;
    }
    return common::trim(value.substr(0, value.find('#')));
}

std::string_view unquote(std::string_view value) {
    if (value.size() >= 2 && isQuote(value.front()) && value.back() == value.front())
        return value.substr(1, value.size() - 2);
    return value;
}

struct Assignment {
    std::string_view key;
    std::string_view value;
};

std::optional<Assignment> splitAssignment(std::string_view line) {
    auto eq = line.find('=');
    if (eq == std::string_view::npos)
        return std::nullopt;
    return Assignment{common::trim(line.substr(0, eq)),
                      stripComment(common::trim(line.substr(eq + 1)))};
}

} // namespace

fs::path expand_tilde(const std::string& path) {
    if (path.empty() || path.front() != '~' || (path.size() > 1 && path[1] != '/'))
        return path;

    auto home = env_value("HOME");
    if (!home)
        return path;
    return path.size() <= 2 ? fs::path(*home) : fs::path(*home) / path.substr(2);
}

std::optional<std::string> env_value(const char* name) {
    const char* raw = std::getenv(name);
    if (!raw || *raw == '\0')
        return std::nullopt;
    return std::string(raw);
}

std::optional<bool> parse_bool(std::string value) {
    value = std::string(common::trim(value));
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const char* yes : {"true", "1", "yes", "on"}) {
        if (value == yes)
            return true;
    }
    for (const char* no : {"false", "0", "no", "off"}) {
        if (value == no)
            return false;
    }
    return std::nullopt;
}

std::string parse_config_value(const fs::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream in(config_path);
    if (!in)
        return {};

    const std::string dottedKey = section.empty() ? key : section + "." + key;
    std::string activeSection;
    std::string raw;

    while (std::getline(in, raw)) {
        const auto line = common::trim(raw);
        if (line.empty() || line.front() == '#')
            continue;

        if (line.front() == '[') {
            if (auto close = line.find(']'); close != std::string_view::npos)
                activeSection = std::string(common::trim(line.substr(1, close - 1)));
            continue;
        }

        auto assignment = splitAssignment(line);
        if (!assignment)
            continue;

        const bool sectionMatches = section.empty() || activeSection == section;
        if ((sectionMatches && assignment->key == key) || assignment->key == dottedKey)
            return std::string(unquote(assignment->value));
    }
    return {};
}

fs::path get_config_path(const std::string& override_path) {
    if (!override_path.empty())
        return fs::path(override_path);

    if (auto explicitPath = env_value("DOCINDEX_CONFIG"))
        return expand_tilde(*explicitPath);

    if (auto xdg = env_value("XDG_CONFIG_HOME"))
        return fs::path(*xdg) / "docindex" / "config.toml";
    if (auto home = env_value("HOME"))
        return fs::path(*home) / ".config" / "docindex" / "config.toml";
    return {};
}

fs::path get_data_dir() {
    if (auto xdg = env_value("XDG_DATA_HOME"))
        return fs::path(*xdg) / "docindex";
    if (auto home = env_value("HOME"))
        return fs::path(*home) / ".local" / "share" / "docindex";
    return fs::current_path() / "docindex_data";
}

fs::path resolve_data_dir_from_config(const fs::path& config_path) {
    if (auto fromEnv = env_value("DOCINDEX_DATA_DIR"))
        return expand_tilde(*fromEnv);

    const fs::path file = config_path.empty() ? get_config_path() : config_path;
    if (!file.empty()) {
        if (auto configured = parse_config_value(file, "core", "data_dir"); !configured.empty())
            return expand_tilde(configured);
    }
    return get_data_dir();
}

} // namespace docindex::config

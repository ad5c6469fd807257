#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace parfetch::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / path.substr(path.size() > 1 ? 2 : 1);
        }
    }
    return path;
}

// Flattened "section.key" -> raw value map for a TOML-style file
using FlatConfig = std::map<std::string, std::string>;

// Parse every key/value pair of a TOML config file. Inline comments are removed
// and values are unquoted. Returns an empty map when the file is unreadable.
FlatConfig parse_config_file(const std::filesystem::path& config_path);

// Parse a single value from a TOML config file ("" when absent)
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Parse helpers; return false on malformed input and leave `out` untouched
bool parse_bool(std::string_view s, bool& out);
bool parse_u64(std::string_view s, std::uint64_t& out);
bool parse_double(std::string_view s, double& out);

// Accepts plain byte counts and K/M/G suffixes (binary multiples), e.g. "1M"
bool parse_size(std::string_view s, std::uint64_t& out);

} // namespace parfetch::config

#include <charconv>
#include <fstream>
#include <parfetch/config/config_helpers.h>

namespace parfetch::config {

FlatConfig parse_config_file(const std::filesystem::path& config_path) {
    FlatConfig out;
    std::ifstream file(config_path);
    if (!file) {
        return out;
    }

    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments (outside quotes)
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        // Support both "segments.max" and "[segments] max"
        std::string fullKey = (currentSection.empty() || k.find('.') != std::string::npos)
                                  ? k
                                  : currentSection + "." + k;
        out[fullKey] = unquote(v);
    }
    return out;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto flat = parse_config_file(config_path);
    auto it = flat.find(section.empty() ? key : section + "." + key);
    return it == flat.end() ? std::string{} : it->second;
}

bool parse_bool(std::string_view s, bool& out) {
    std::string v(s);
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1" || v == "yes" || v == "on") {
        out = true;
        return true;
    }
    if (v == "false" || v == "0" || v == "no" || v == "off") {
        out = false;
        return true;
    }
    return false;
}

bool parse_u64(std::string_view s, std::uint64_t& out) {
    std::string v(s);
    trim(v);
    if (v.empty())
        return false;
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), value);
    if (ec != std::errc() || ptr != v.data() + v.size())
        return false;
    out = value;
    return true;
}

bool parse_double(std::string_view s, double& out) {
    std::string v(s);
    trim(v);
    if (v.empty())
        return false;
    try {
        size_t idx = 0;
        double value = std::stod(v, &idx);
        if (idx != v.size())
            return false;
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_size(std::string_view s, std::uint64_t& out) {
    std::string v(s);
    trim(v);
    if (v.empty())
        return false;
    std::uint64_t mult = 1;
    switch (std::toupper(static_cast<unsigned char>(v.back()))) {
        case 'K':
            mult = 1024ull;
            break;
        case 'M':
            mult = 1024ull * 1024ull;
            break;
        case 'G':
            mult = 1024ull * 1024ull * 1024ull;
            break;
        default:
            break;
    }
    if (mult != 1)
        v.pop_back();
    std::uint64_t base = 0;
    if (!parse_u64(v, base))
        return false;
    out = base * mult;
    return true;
}

} // namespace parfetch::config

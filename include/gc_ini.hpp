/**
 * @file gc_ini.hpp
 * @brief INI threshold file parsing
 * @author GymCoach Analytics Team
 * @version 1.0.0
 * @date 2025-01-06
 *
 * This header provides:
 * - INI parsing with line-numbered syntax errors
 * - Section and key lookup
 * - Strict number and boolean parsing for config values
 */

#ifndef GYMCOACH_GC_INI_HPP
#define GYMCOACH_GC_INI_HPP

#include "result.hpp"

#include <string>
#include <string_view>
#include <map>
#include <optional>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <charconv>

namespace gymcoach {
namespace ini {

/// Whitespace-trimmed copy of @p str.
inline std::string trim(std::string_view str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return std::string(str.substr(start, end - start + 1));
}

/// Strict decimal parse: the whole string must be consumed.
inline std::optional<double> parseDouble(const std::string& text) {
    std::istringstream iss(text);
    double value = 0.0;
    iss >> value;
    if (iss.fail()) return std::nullopt;
    iss >> std::ws;
    if (!iss.eof()) return std::nullopt;
    return value;
}

inline std::optional<long long> parseInteger(const std::string& text) {
    long long value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) return std::nullopt;
    return value;
}

/// Recognizes true/false, yes/no, 1/0, on/off.
inline std::optional<bool> parseBool(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (text == "true" || text == "yes" || text == "1" || text == "on") return true;
    if (text == "false" || text == "no" || text == "0" || text == "off") return false;
    return std::nullopt;
}

// ============================================================================
// INI Section
// ============================================================================

class IniSection {
public:
    using KeyValueMap = std::map<std::string, std::string>;

    void set(const std::string& key, const std::string& value) { values_[key] = value; }

    [[nodiscard]] bool empty() const noexcept { return values_.empty(); }
    [[nodiscard]] const KeyValueMap& values() const noexcept { return values_; }

private:
    KeyValueMap values_;
};

// ============================================================================
// INI File
// ============================================================================

class IniFile {
public:
    using SectionMap = std::map<std::string, IniSection>;

    /**
     * @brief Parse INI text
     * @return Parsed file, or CONFIG_PARSE_ERROR naming the first bad line
     */
    [[nodiscard]] static Result<IniFile> parse(std::string_view content);

    /**
     * @brief Load and parse an INI file
     * @return Parsed file, CONFIG_MISSING if unreadable, or a parse error
     */
    [[nodiscard]] static Result<IniFile> load(const std::string& path);

    /// Keys that appear before the first section header.
    [[nodiscard]] const IniSection& global() const noexcept { return global_; }
    [[nodiscard]] const SectionMap& sections() const noexcept { return sections_; }

private:
    IniSection& section(const std::string& name) {
        return sections_[name];
    }

    IniSection global_;
    SectionMap sections_;
};

// ============================================================================
// Implementation
// ============================================================================

inline Result<IniFile> IniFile::parse(std::string_view content) {
    IniFile result;
    IniSection* current = &result.global_;

    std::istringstream iss{std::string(content)};
    std::string raw;
    int lineNo = 0;

    while (std::getline(iss, raw)) {
        ++lineNo;
        std::string line = trim(raw);
        if (line.empty() || line[0] == ';' || line[0] == '#') continue;

        if (line.front() == '[') {
            if (line.back() != ']' || line.size() < 3) {
                return Error{ErrorCode::CONFIG_PARSE_ERROR,
                             "malformed section header at line " + std::to_string(lineNo)};
            }
            current = &result.section(trim(std::string_view(line).substr(1, line.size() - 2)));
            continue;
        }

        auto pos = line.find('=');
        if (pos == std::string::npos) {
            return Error{ErrorCode::CONFIG_PARSE_ERROR,
                         "expected key = value at line " + std::to_string(lineNo)};
        }
        std::string key = trim(std::string_view(line).substr(0, pos));
        std::string value = trim(std::string_view(line).substr(pos + 1));
        if (key.empty()) {
            return Error{ErrorCode::CONFIG_PARSE_ERROR,
                         "empty key at line " + std::to_string(lineNo)};
        }
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }
        current->set(key, value);
    }

    return result;
}

inline Result<IniFile> IniFile::load(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::CONFIG_MISSING, "cannot open " + path};
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return parse(oss.str()).withContext(path);
}

} // namespace ini
} // namespace gymcoach

#endif // GYMCOACH_GC_INI_HPP

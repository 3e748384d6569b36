/**
 * @file gc_args.hpp
 * @brief Command-line argument parsing for the gymcoach driver
 * @author GymCoach Analytics Team
 * @version 1.0.0
 * @date 2025-01-06
 *
 * This header provides:
 * - Option definitions with short/long forms
 * - Flags, single-value and repeatable options
 * - Checked numeric conversion of option values
 * - Help generation
 */

#ifndef GYMCOACH_GC_ARGS_HPP
#define GYMCOACH_GC_ARGS_HPP

#include "gc_ini.hpp"

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <sstream>
#include <algorithm>

namespace gymcoach {
namespace args {

// ============================================================================
// Argument Types
// ============================================================================

enum class ArgType {
    Flag,       // Boolean flag (no value)
    Value,      // Single value, last one wins
    MultiValue  // Repeatable
};

/**
 * @brief Parsed argument value
 */
class ArgValue {
public:
    ArgValue() = default;

    [[nodiscard]] bool isSet() const noexcept { return isSet_; }
    [[nodiscard]] std::size_t count() const noexcept { return values_.size(); }

    [[nodiscard]] std::string asString(const std::string& defaultValue = "") const {
        return values_.empty() ? defaultValue : values_.back();
    }

    /**
     * @brief Integer value, or nullopt when unset or not a whole number
     */
    [[nodiscard]] std::optional<long long> asInteger() const {
        if (values_.empty()) return std::nullopt;
        return ini::parseInteger(values_.back());
    }

    /**
     * @brief Integer value narrowed to int, or nullopt when outside [lo, hi]
     */
    [[nodiscard]] std::optional<int> asIntInRange(int lo, int hi) const {
        auto n = asInteger();
        if (!n || *n < lo || *n > hi) return std::nullopt;
        return static_cast<int>(*n);
    }

    [[nodiscard]] const std::vector<std::string>& values() const noexcept { return values_; }

    [[nodiscard]] explicit operator bool() const noexcept { return isSet_; }

    void set() { isSet_ = true; }
    void addValue(std::string value) {
        isSet_ = true;
        values_.push_back(std::move(value));
    }
    void clear() {
        isSet_ = false;
        values_.clear();
    }

private:
    bool isSet_ = false;
    std::vector<std::string> values_;
};

// ============================================================================
// Argument Definition
// ============================================================================

struct ArgDef {
    std::string name;           // Long name (e.g., "history")
    char shortName = '\0';      // Short name (e.g., 'H')
    std::string description;
    ArgType type = ArgType::Value;
    std::string defaultValue;
    std::string metavar;        // Value placeholder in help (e.g., "FILE")
    bool required = false;
};

// ============================================================================
// Parse Result
// ============================================================================

class ParseResult {
public:
    ParseResult() = default;

    [[nodiscard]] bool success() const noexcept { return error_.empty(); }
    [[nodiscard]] const std::string& error() const noexcept { return error_; }

    [[nodiscard]] const ArgValue& get(const std::string& name) const {
        static const ArgValue empty;
        auto it = args_.find(name);
        return it != args_.end() ? it->second : empty;
    }

    [[nodiscard]] bool has(const std::string& name) const {
        auto it = args_.find(name);
        return it != args_.end() && it->second.isSet();
    }

    [[nodiscard]] bool helpRequested() const { return has("help"); }

    [[nodiscard]] const std::vector<std::string>& positional() const noexcept { return positional_; }

    [[nodiscard]] const ArgValue& operator[](const std::string& name) const { return get(name); }

    void setError(std::string error) { error_ = std::move(error); }
    void addPositional(std::string value) { positional_.push_back(std::move(value)); }
    ArgValue& argRef(const std::string& name) { return args_[name]; }

private:
    std::string error_;
    std::map<std::string, ArgValue> args_;
    std::vector<std::string> positional_;
};

// ============================================================================
// Argument Parser
// ============================================================================

class ArgParser {
public:
    explicit ArgParser(std::string programName = "", std::string description = "")
        : programName_(std::move(programName))
        , description_(std::move(description)) {}

    ArgParser& addFlag(const std::string& name, char shortName = '\0',
                       const std::string& description = "") {
        ArgDef def;
        def.name = name;
        def.shortName = shortName;
        def.description = description;
        def.type = ArgType::Flag;
        args_.push_back(std::move(def));
        return *this;
    }

    ArgParser& addOption(const std::string& name, char shortName = '\0',
                         const std::string& description = "",
                         const std::string& defaultValue = "",
                         const std::string& metavar = "VALUE") {
        ArgDef def;
        def.name = name;
        def.shortName = shortName;
        def.description = description;
        def.type = ArgType::Value;
        def.defaultValue = defaultValue;
        def.metavar = metavar;
        args_.push_back(std::move(def));
        return *this;
    }

    ArgParser& addRequired(const std::string& name, char shortName = '\0',
                           const std::string& description = "",
                           const std::string& metavar = "VALUE") {
        ArgDef def;
        def.name = name;
        def.shortName = shortName;
        def.description = description;
        def.type = ArgType::Value;
        def.metavar = metavar;
        def.required = true;
        args_.push_back(std::move(def));
        return *this;
    }

    ArgParser& addMulti(const std::string& name, char shortName = '\0',
                        const std::string& description = "",
                        const std::string& metavar = "VALUE") {
        ArgDef def;
        def.name = name;
        def.shortName = shortName;
        def.description = description;
        def.type = ArgType::MultiValue;
        def.metavar = metavar;
        args_.push_back(std::move(def));
        return *this;
    }

    [[nodiscard]] ParseResult parse(int argc, char* argv[]) const {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) args.push_back(argv[i]);
        return parse(args);
    }

    /**
     * @brief Parse a token list
     *
     * Accepts --name value, --name=value, -n value and -nvalue. A value given
     * on the command line replaces the default of a single-value option.
     */
    [[nodiscard]] ParseResult parse(const std::vector<std::string>& args) const {
        ParseResult result;
        for (const auto& def : args_) {
            if (!def.defaultValue.empty()) result.argRef(def.name).addValue(def.defaultValue);
        }
        std::map<std::string, bool> explicitlySet;

        auto store = [&](const ArgDef& def, std::string value) {
            auto& slot = result.argRef(def.name);
            if (def.type == ArgType::Value && !explicitlySet[def.name]) slot.clear();
            explicitlySet[def.name] = true;
            slot.addValue(std::move(value));
        };

        std::size_t i = 0;
        while (i < args.size()) {
            const std::string& arg = args[i];

            if (arg == "--help" || arg == "-h") {
                result.argRef("help").set();
                ++i;
                continue;
            }

            if (arg.size() >= 2 && arg[0] == '-' && arg[1] == '-') {
                std::string name = arg.substr(2);
                std::string value;
                bool inlineValue = false;
                auto eqPos = name.find('=');
                if (eqPos != std::string::npos) {
                    value = name.substr(eqPos + 1);
                    name = name.substr(0, eqPos);
                    inlineValue = true;
                }

                const ArgDef* def = findByName(name);
                if (!def) {
                    result.setError("Unknown option: --" + name);
                    return result;
                }
                if (def->type == ArgType::Flag) {
                    result.argRef(def->name).set();
                } else {
                    if (!inlineValue && i + 1 < args.size()) value = args[++i];
                    if (value.empty()) {
                        result.setError("Option --" + name + " requires a value");
                        return result;
                    }
                    store(*def, value);
                }
            } else if (arg.size() >= 2 && arg[0] == '-') {
                for (std::size_t j = 1; j < arg.size(); ++j) {
                    const char shortName = arg[j];
                    const ArgDef* def = findByShort(shortName);
                    if (!def) {
                        result.setError(std::string("Unknown option: -") + shortName);
                        return result;
                    }
                    if (def->type == ArgType::Flag) {
                        result.argRef(def->name).set();
                        continue;
                    }
                    std::string value;
                    if (j + 1 < arg.size()) value = arg.substr(j + 1);
                    else if (i + 1 < args.size()) value = args[++i];
                    if (value.empty()) {
                        result.setError(std::string("Option -") + shortName + " requires a value");
                        return result;
                    }
                    store(*def, value);
                    break;
                }
            } else {
                result.addPositional(arg);
            }
            ++i;
        }

        if (result.helpRequested()) return result;
        for (const auto& def : args_) {
            if (def.required && !result.has(def.name)) {
                result.setError("Required option missing: --" + def.name);
                return result;
            }
        }
        return result;
    }

    [[nodiscard]] std::string help() const {
        std::ostringstream oss;
        oss << "Usage: " << programName_ << " [OPTIONS]\n\n";
        if (!description_.empty()) oss << description_ << "\n\n";
        oss << "Options:\n";

        std::size_t maxWidth = 0;
        for (const auto& def : args_) {
            std::size_t width = 4 + def.name.size();
            if (def.type != ArgType::Flag) width += 1 + def.metavar.size();
            maxWidth = std::max(maxWidth, width);
        }
        maxWidth = std::max(maxWidth, std::size_t(20));

        oss << "  -h, --help" << std::string(maxWidth - 8, ' ') << "Show this help message\n";
        for (const auto& def : args_) {
            oss << "  ";
            if (def.shortName != '\0') oss << "-" << def.shortName << ", ";
            else oss << "    ";
            oss << "--" << def.name;

            std::size_t width = 4 + def.name.size();
            if (def.type != ArgType::Flag) {
                oss << " " << def.metavar;
                width += 1 + def.metavar.size();
            }
            oss << std::string(maxWidth - width + 2, ' ') << def.description;
            if (def.required) oss << " (required)";
            else if (def.type == ArgType::MultiValue) oss << " (repeatable)";
            else if (!def.defaultValue.empty()) oss << " [default: " << def.defaultValue << "]";
            oss << "\n";
        }
        return oss.str();
    }

private:
    std::string programName_;
    std::string description_;
    std::vector<ArgDef> args_;

    [[nodiscard]] const ArgDef* findByName(const std::string& name) const {
        for (const auto& def : args_) {
            if (def.name == name) return &def;
        }
        return nullptr;
    }

    [[nodiscard]] const ArgDef* findByShort(char shortName) const {
        for (const auto& def : args_) {
            if (def.shortName == shortName) return &def;
        }
        return nullptr;
    }
};

} // namespace args
} // namespace gymcoach

#endif // GYMCOACH_GC_ARGS_HPP

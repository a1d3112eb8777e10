/**
 * @file Errors.hpp
 * @brief Exception types for multiconf configuration errors
 *
 * Error taxonomy:
 * - ConfigError: Base class
 * - InvalidName / InvalidType / UnsupportedAction / InvalidDefault:
 *   raised while registering an item
 * - InvalidChoice / CoercionError / RequiredValueMissing:
 *   raised while resolving
 * - SourceConstructionError / FileNotFoundError / ConfigParseError /
 *   CommandLineError: raised by source adapters
 * - KeyError: Namespace lookup of a name that has no entry
 */

#ifndef MULTICONF_ERRORS_HPP
#define MULTICONF_ERRORS_HPP

#include "multiconf/Value.hpp"

#include <stdexcept>
#include <string>
#include <vector>
#include <sstream>

namespace multiconf {

/**
 * @brief Base class for all multiconf exceptions
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Item name is not an identifier, or is already registered
 */
class InvalidName : public ConfigError {
public:
    InvalidName(std::string name, const std::string& reason)
        : ConfigError("Invalid config name '" + name + "': " + reason)
        , name_(std::move(name))
    {}

    const std::string& name() const noexcept {
        return name_;
    }

private:
    std::string name_;
};

/**
 * @brief Item coercion cannot be invoked (empty function or unknown name)
 */
class InvalidType : public ConfigError {
public:
    InvalidType(std::string name, const std::string& reason)
        : ConfigError("Invalid type for config item '" + name + "': " + reason)
        , name_(std::move(name))
    {}

    const std::string& name() const noexcept {
        return name_;
    }

private:
    std::string name_;
};

/**
 * @brief Action is unknown, not implemented, or combined with an option
 *        it does not support
 */
class UnsupportedAction : public ConfigError {
public:
    UnsupportedAction(std::string name, std::string action, const std::string& reason)
        : ConfigError("Config item '" + name + "' (action '" + action + "'): " + reason)
        , name_(std::move(name))
        , action_(std::move(action))
    {}

    const std::string& name() const noexcept {
        return name_;
    }

    const std::string& action() const noexcept {
        return action_;
    }

private:
    std::string name_;
    std::string action_;
};

/**
 * @brief Item default has the wrong shape for its action
 *
 * An append default must be an array; a count default must be a number.
 */
class InvalidDefault : public ConfigError {
public:
    InvalidDefault(std::string name, const std::string& expected, const Value& actual)
        : ConfigError("Invalid default for config item '" + name + "': expected " +
                      expected + ", got " + type_name(actual))
        , name_(std::move(name))
    {}

    const std::string& name() const noexcept {
        return name_;
    }

private:
    std::string name_;
};

/**
 * @brief Coerced value is not one of the item's permitted choices
 */
class InvalidChoice : public ConfigError {
public:
    /**
     * @param name Item name
     * @param value The coerced value that was rejected
     * @param choices The permitted values
     */
    InvalidChoice(std::string name, Value value, std::vector<Value> choices)
        : ConfigError(format_message(name, value, choices))
        , name_(std::move(name))
        , value_(std::move(value))
        , choices_(std::move(choices))
    {}

    const std::string& name() const noexcept {
        return name_;
    }

    const Value& value() const noexcept {
        return value_;
    }

    const std::vector<Value>& choices() const noexcept {
        return choices_;
    }

private:
    std::string name_;
    Value value_;
    std::vector<Value> choices_;

    static std::string format_message(const std::string& name, const Value& value,
                                      const std::vector<Value>& choices) {
        std::ostringstream oss;
        oss << "invalid choice '" << display(value) << "' for config item '" << name
            << "'; valid choices are (";
        for (size_t i = 0; i < choices.size(); ++i) {
            if (i > 0) oss << ",";
            oss << display(choices[i]);
        }
        oss << ")";
        return oss.str();
    }
};

/**
 * @brief The item's coercion rejected a raw value
 */
class CoercionError : public ConfigError {
public:
    /**
     * @param name Item name (may be empty when thrown from a bare coercion;
     *             the resolver fills it in)
     * @param raw The raw value handed to the coercion
     * @param details Why the coercion failed
     */
    CoercionError(std::string name, Value raw, std::string details)
        : ConfigError(format_message(name, raw, details))
        , name_(std::move(name))
        , raw_(std::move(raw))
        , details_(std::move(details))
    {}

    const std::string& name() const noexcept {
        return name_;
    }

    const Value& raw() const noexcept {
        return raw_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string name_;
    Value raw_;
    std::string details_;

    static std::string format_message(const std::string& name, const Value& raw,
                                      const std::string& details) {
        std::ostringstream oss;
        oss << "cannot convert '" << display(raw) << "'";
        if (!name.empty()) oss << " for config item '" << name << "'";
        oss << ": " << details;
        return oss.str();
    }
};

/**
 * @brief Required items have no value from any source
 *
 * Contains the list of all missing items, in registration order.
 */
class RequiredValueMissing : public ConfigError {
public:
    /**
     * @brief Construct with list of missing items
     * @param items Names of required items without a value
     */
    explicit RequiredValueMissing(std::vector<std::string> items)
        : ConfigError(format_message(items))
        , missing_items_(std::move(items))
    {}

    /**
     * @brief Get the list of missing items
     */
    const std::vector<std::string>& missing_items() const noexcept {
        return missing_items_;
    }

private:
    std::vector<std::string> missing_items_;

    static std::string format_message(const std::vector<std::string>& items) {
        std::ostringstream oss;
        oss << "Did not find value for required config items: [";
        for (size_t i = 0; i < items.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << "'" << items[i] << "'";
        }
        oss << "]";
        return oss.str();
    }
};

/**
 * @brief A source was constructed with inconsistent arguments
 */
class SourceConstructionError : public ConfigError {
public:
    using ConfigError::ConfigError;
};

/**
 * @brief Configuration file not found
 */
class FileNotFoundError : public ConfigError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : ConfigError("Configuration file not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Configuration document parse error (JSON/TOML syntax or shape)
 */
class ConfigParseError : public ConfigError {
public:
    /**
     * @brief Construct with file path and error details
     * @param file Path to the file with parse error ("<stream>" for streams)
     * @param details Detailed error message from parser
     */
    ConfigParseError(std::string file, std::string details)
        : ConfigError("Parse error in '" + file + "': " + details)
        , file_(std::move(file))
        , details_(std::move(details))
    {}

    /**
     * @brief Get the file path with parse error
     */
    const std::string& file() const noexcept {
        return file_;
    }

    /**
     * @brief Get detailed error message
     */
    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    std::string details_;
};

/**
 * @brief The command-line parser rejected the arguments
 */
class CommandLineError : public ConfigError {
public:
    CommandLineError(std::string program, const std::string& details)
        : ConfigError(program + ": error: " + details)
        , program_(std::move(program))
    {}

    const std::string& program() const noexcept {
        return program_;
    }

private:
    std::string program_;
};

/**
 * @brief Name not present in a Namespace
 */
class KeyError : public ConfigError {
public:
    explicit KeyError(std::string name)
        : ConfigError("Key not found: '" + name + "'")
        , name_(std::move(name))
    {}

    const std::string& name() const noexcept {
        return name_;
    }

private:
    std::string name_;
};

} // namespace multiconf

#endif // MULTICONF_ERRORS_HPP

/**
 * @file Coerce.cpp
 * @brief Implementation of type parsing and built-in coercions
 */

#include "multiconf/Coerce.hpp"
#include "multiconf/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <limits>
#include <regex>
#include <sstream>

namespace multiconf {

namespace {
    /**
     * @brief Convert string to lowercase
     */
    std::string to_lower(const std::string& str) {
        std::string result = str;
        std::transform(result.begin(), result.end(), result.begin(),
                      [](unsigned char c) { return std::tolower(c); });
        return result;
    }

    std::string trim(const std::string& s) {
        auto start = s.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) return "";
        auto end = s.find_last_not_of(" \t\r\n");
        return s.substr(start, end - start + 1);
    }

    /**
     * @brief Check if string matches regex pattern
     */
    bool matches_regex(const std::string& str, const std::string& pattern) {
        try {
            std::regex re(pattern);
            return std::regex_match(str, re);
        } catch (const std::regex_error&) {
            return false;
        }
    }

    [[noreturn]] void reject(const Value& raw, const std::string& details) {
        throw CoercionError("", raw, details);
    }
}

Value parse_value(const std::string& str) {
    // Empty string stays as string
    if (str.empty()) {
        return "";
    }

    std::string lower = to_lower(str);
    if (lower == "true") {
        return true;
    }
    if (lower == "false") {
        return false;
    }

    if (lower == "null") {
        return nullptr;
    }

    // Pattern: ^-?[0-9]+$
    if (matches_regex(str, "^-?[0-9]+$")) {
        try {
            size_t pos = 0;
            long long val = std::stoll(str, &pos);
            if (pos == str.size()) {
                return static_cast<int64_t>(val);
            }
        } catch (const std::out_of_range&) {
            // Too large for int64, fall through to float / string
        }
    }

    // Pattern: ^-?[0-9]+\.[0-9]+([eE][+-]?[0-9]+)?$
    if (matches_regex(str, "^-?[0-9]+\\.[0-9]+([eE][+-]?[0-9]+)?$")) {
        try {
            size_t pos = 0;
            double val = std::stod(str, &pos);
            if (pos == str.size()) {
                return val;
            }
        } catch (const std::out_of_range&) {
        }
    }

    // JSON compound (objects and arrays)
    if ((str.front() == '{' && str.back() == '}') ||
        (str.front() == '[' && str.back() == ']')) {
        Value parsed = Value::parse(str, nullptr, false);
        if (!parsed.is_discarded()) {
            return parsed;
        }
    }

    // Quoted string, JSON escapes honoured
    if (str.size() >= 2 && str.front() == '"' && str.back() == '"') {
        Value parsed = Value::parse(str, nullptr, false);
        if (!parsed.is_discarded() && parsed.is_string()) {
            return parsed;
        }
    }

    return str;
}

namespace coerce {

Value as_string(const Value& raw) {
    if (raw.is_string()) return raw;
    return raw.dump();
}

Value as_int(const Value& raw) {
    if (raw.is_number_integer()) return raw;
    if (raw.is_number_float()) {
        double d = raw.get<double>();
        if (std::isfinite(d) && std::trunc(d) == d &&
            d >= static_cast<double>(std::numeric_limits<int64_t>::min()) &&
            d <= static_cast<double>(std::numeric_limits<int64_t>::max())) {
            return static_cast<int64_t>(d);
        }
        reject(raw, "not an integral number");
    }
    if (raw.is_string()) {
        std::string s = trim(raw.get<std::string>());
        if (!matches_regex(s, "^[+-]?[0-9]+$")) {
            reject(raw, "invalid literal for int");
        }
        try {
            return static_cast<int64_t>(std::stoll(s));
        } catch (const std::out_of_range&) {
            reject(raw, "integer out of range");
        }
    }
    if (raw.is_boolean()) return raw.get<bool>() ? 1 : 0;
    reject(raw, "cannot convert " + type_name(raw) + " to int");
}

Value as_float(const Value& raw) {
    if (raw.is_number()) return raw.get<double>();
    if (raw.is_string()) {
        std::string s = trim(raw.get<std::string>());
        if (s.empty()) reject(raw, "empty string");
        try {
            size_t pos = 0;
            double d = std::stod(s, &pos);
            if (pos == s.size()) return d;
        } catch (const std::invalid_argument&) {
        } catch (const std::out_of_range&) {
            reject(raw, "float out of range");
        }
        reject(raw, "invalid literal for float");
    }
    reject(raw, "cannot convert " + type_name(raw) + " to float");
}

Value as_bool(const Value& raw) {
    if (raw.is_boolean()) return raw;
    if (raw.is_number_integer()) {
        auto i = raw.get<int64_t>();
        if (i == 0 || i == 1) return i == 1;
    }
    if (raw.is_string()) {
        std::string s = to_lower(trim(raw.get<std::string>()));
        if (s == "true" || s == "1" || s == "yes" || s == "on") return true;
        if (s == "false" || s == "0" || s == "no" || s == "off") return false;
    }
    reject(raw, "not a boolean");
}

Value as_json(const Value& raw) {
    if (!raw.is_string()) return raw;
    try {
        return Value::parse(raw.get<std::string>());
    } catch (const nlohmann::json::parse_error& e) {
        reject(raw, e.what());
    }
}

Value split_words(const Value& raw) {
    if (!raw.is_string()) {
        reject(raw, "cannot split " + type_name(raw) + " into words");
    }
    Value words = Value::array();
    std::istringstream iss(raw.get<std::string>());
    std::string word;
    while (iss >> word) words.push_back(word);
    return words;
}

Value as_auto(const Value& raw) {
    if (!raw.is_string()) return raw;
    return parse_value(raw.get<std::string>());
}

Value as_path(const Value& raw) {
    if (!raw.is_string()) {
        reject(raw, "cannot convert " + type_name(raw) + " to a path");
    }
    std::filesystem::path p(raw.get<std::string>());
    return p.lexically_normal().generic_string();
}

} // namespace coerce

const std::vector<std::string>& builtin_coercion_names() {
    static const std::vector<std::string> names = {
        "str", "int", "float", "bool", "json", "words", "auto", "path"
    };
    return names;
}

Coercion coercion_by_name(const std::string& type_name) {
    if (type_name == "str") return coerce::as_string;
    if (type_name == "int") return coerce::as_int;
    if (type_name == "float") return coerce::as_float;
    if (type_name == "bool") return coerce::as_bool;
    if (type_name == "json") return coerce::as_json;
    if (type_name == "words") return coerce::split_words;
    if (type_name == "auto") return coerce::as_auto;
    if (type_name == "path") return coerce::as_path;
    throw InvalidType("", "unknown type '" + type_name + "'");
}

} // namespace multiconf

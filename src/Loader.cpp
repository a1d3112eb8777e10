/**
 * @file Loader.cpp
 * @brief Document loading implementation
 */

#include "multiconf/Loader.hpp"
#include "multiconf/Errors.hpp"
#include "multiconf/Log.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace multiconf {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

/**
 * @brief Convert string to lowercase.
 */
std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

/**
 * @brief Check if file exists.
 */
bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

/**
 * @brief Read entire file into string.
 */
std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

Value require_object(Value doc, const std::string& label) {
    if (!doc.is_object()) {
        throw ConfigParseError(label, "top level must be an object, got " + type_name(doc));
    }
    return doc;
}

Value parse_json_text(const std::string& content, const std::string& label) {
    try {
        return require_object(nlohmann::json::parse(content), label);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigParseError(label, e.what());
    }
}

/**
 * @brief Convert toml++ value to nlohmann::json.
 */
Value toml_value_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date: {
            std::ostringstream ss;
            ss << node.as_date()->get();
            return Value(ss.str());
        }

        case toml::node_type::time: {
            std::ostringstream ss;
            ss << node.as_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::date_time: {
            std::ostringstream ss;
            ss << node.as_date_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_value_to_json(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_value_to_json(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

ConfigParseError toml_error(const std::string& label, const toml::parse_error& e) {
    std::ostringstream oss;
    oss << e.description() << " (line " << e.source().begin.line
        << ", column " << e.source().begin.column << ")";
    return ConfigParseError(label, oss.str());
}

} // anonymous namespace

// ============================================================================
// JSON
// ============================================================================

Value load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    logger()->debug("loading JSON document '{}'", path);
    return parse_json_text(read_file(path), path);
}

Value load_json_stream(std::istream& in, const std::string& label) {
    if (!in) {
        throw ConfigParseError(label, "stream is not readable");
    }
    logger()->debug("loading JSON document from {}", label);
    std::ostringstream ss;
    ss << in.rdbuf();
    return parse_json_text(ss.str(), label);
}

// ============================================================================
// TOML
// ============================================================================

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    logger()->debug("loading TOML document '{}'", path);

    try {
        toml::table table = toml::parse_file(path);
        return toml_value_to_json(table);
    } catch (const toml::parse_error& e) {
        throw toml_error(path, e);
    }
}

Value load_toml_stream(std::istream& in, const std::string& label) {
    if (!in) {
        throw ConfigParseError(label, "stream is not readable");
    }
    logger()->debug("loading TOML document from {}", label);

    try {
        toml::table table = toml::parse(in, label);
        return toml_value_to_json(table);
    } catch (const toml::parse_error& e) {
        throw toml_error(label, e);
    }
}

// ============================================================================
// Auto-detect
// ============================================================================

std::string get_file_extension(const std::string& path) {
    fs::path p(path);
    return to_lower(p.extension().string());
}

Value load_document_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return load_json_file(path);
    } else if (ext == ".toml") {
        return load_toml_file(path);
    }
    throw ConfigError("Unsupported config file type: '" + ext + "' (expected .json or .toml)");
}

} // namespace multiconf

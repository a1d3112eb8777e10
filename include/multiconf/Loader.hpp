/**
 * @file Loader.hpp
 * @brief Document loading utilities
 *
 * Implements loading flat configuration documents from:
 * - JSON files and streams (using nlohmann::json)
 * - TOML files and streams (using toml++)
 *
 * Every loader returns a Value holding a JSON object; a document whose
 * top level is not an object/table is a ConfigParseError.
 */

#ifndef MULTICONF_LOADER_HPP
#define MULTICONF_LOADER_HPP

#include "multiconf/Value.hpp"

#include <istream>
#include <string>

namespace multiconf {

// ============================================================================
// JSON
// ============================================================================

/**
 * @brief Load a JSON document from a file.
 *
 * @param path Path to the JSON file
 * @return Parsed object
 * @throws FileNotFoundError if file doesn't exist
 * @throws ConfigParseError if JSON syntax is invalid or the top level
 *         is not an object
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a JSON document from an open stream.
 *
 * @param in Stream positioned at the start of the document
 * @param label Name used in error messages
 * @throws ConfigParseError as for load_json_file
 */
Value load_json_stream(std::istream& in, const std::string& label = "<stream>");

// ============================================================================
// TOML
// ============================================================================

/**
 * @brief Load a TOML document from a file.
 *
 * Sub-tables become nested objects; dates and times become strings.
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws ConfigParseError if TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

/// As load_toml_file, reading from an open stream.
Value load_toml_stream(std::istream& in, const std::string& label = "<stream>");

// ============================================================================
// Auto-detect
// ============================================================================

/**
 * @brief Load a document, choosing the format by extension.
 *
 * ".json" → JSON, ".toml" → TOML.
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ConfigParseError if the file has syntax errors
 * @throws ConfigError if the extension is neither
 */
Value load_document_file(const std::string& path);

/**
 * @brief Get file extension (lowercase).
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

} // namespace multiconf

#endif // MULTICONF_LOADER_HPP

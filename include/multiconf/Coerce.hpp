/**
 * @file Coerce.hpp
 * @brief Coercions from raw source values to typed item values
 *
 * A Coercion receives the raw Value a source produced (a string from
 * the command line, any JSON value from a document or mapping) and
 * returns the typed Value stored for the item. It reports rejection by
 * throwing; CoercionError is preferred, any std::exception is accepted
 * and rewrapped by the item (ItemSpec).
 *
 * Built-in coercions (names accepted by coercion_by_name):
 * - "str"   : strings unchanged, other values as JSON text
 * - "int"   : integers, integral floats, base-10 integer strings
 * - "float" : numbers and numeric strings
 * - "bool"  : JSON booleans, true/false/1/0/yes/no/on/off strings
 * - "json"  : strings parsed as JSON, other values passed through
 * - "words" : string split on whitespace into an array of strings
 * - "auto"  : typed-literal rules, see parse_value()
 * - "path"  : lexically normalized filesystem path string
 */

#ifndef MULTICONF_COERCE_HPP
#define MULTICONF_COERCE_HPP

#include "multiconf/Value.hpp"

#include <functional>
#include <string>
#include <vector>

namespace multiconf {

/// Caller-supplied conversion from a raw value to the item's type.
using Coercion = std::function<Value(const Value&)>;

/**
 * @brief Parse string value to appropriate type
 *
 * Parsing order (first match wins):
 * - "true"/"false" (case-insensitive) → boolean
 * - "null" (case-insensitive) → null
 * - Integer pattern → int64
 * - Float pattern → double
 * - JSON objects/arrays → parsed JSON
 * - Quoted strings → unquoted string
 * - Everything else → raw string
 *
 * Examples:
 * ```cpp
 * parse_value("true")       // → true (boolean)
 * parse_value("42")         // → 42 (integer)
 * parse_value("-2.5e10")    // → -2.5e10 (float)
 * parse_value("[1,2,3]")    // → [1, 2, 3] (array)
 * parse_value("\"hello\"")  // → "hello" (string, unquoted)
 * parse_value("hello")      // → "hello" (string)
 * ```
 */
Value parse_value(const std::string& str);

namespace coerce {

Value as_string(const Value& raw);
Value as_int(const Value& raw);
Value as_float(const Value& raw);
Value as_bool(const Value& raw);
Value as_json(const Value& raw);
Value split_words(const Value& raw);
Value as_auto(const Value& raw);
Value as_path(const Value& raw);

} // namespace coerce

/**
 * @brief Look up a built-in coercion by name
 * @throws InvalidType if the name is not a built-in (item name left empty)
 */
Coercion coercion_by_name(const std::string& type_name);

/// Names accepted by coercion_by_name(), in documentation order.
const std::vector<std::string>& builtin_coercion_names();

} // namespace multiconf

#endif // MULTICONF_COERCE_HPP

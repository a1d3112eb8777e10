/**
 * @file Declarations.hpp
 * @brief Building a Resolver from a declaration document
 *
 * Used by the multiconf tool; also usable by programs that prefer to
 * keep their item list in a file. Document shape (JSON or TOML):
 *
 * ```json
 * {
 *   "global_default": "==SUPPRESS==",
 *   "items": [
 *     {"name": "port", "type": "int", "required": true, "choices": [80, 8080]},
 *     {"name": "tag", "action": "append", "default": ["base"]},
 *     {"name": "verbose", "action": "count", "help": "More output"}
 *   ]
 * }
 * ```
 *
 * Item fields: name (required), action, type (a built-in coercion name),
 * required, choices, default, const, nargs, help. Unknown fields are
 * rejected.
 */

#ifndef MULTICONF_DECLARATIONS_HPP
#define MULTICONF_DECLARATIONS_HPP

#include "multiconf/ItemSpec.hpp"
#include "multiconf/Resolver.hpp"
#include "multiconf/Value.hpp"

#include <string>

namespace multiconf {

/// "global_default" value selecting GlobalDefault::suppress().
extern const char* const SUPPRESS_MARKER;

/**
 * @brief Global default policy from the "global_default" field.
 *
 * Missing field or null → null_value(); SUPPRESS_MARKER → suppress();
 * anything else → value().
 */
GlobalDefault global_default_from_json(const Value& doc);

/**
 * @brief Item options from one entry of "items".
 * @throws ConfigParseError for a malformed entry
 * @throws InvalidType for an unknown type name
 * @throws UnsupportedAction for an unknown or unimplemented action
 */
ItemOptions item_options_from_json(const std::string& name, const Value& decl);

/**
 * @brief Resolver with the document's policy and items, no sources yet.
 * @throws ConfigParseError, InvalidName, InvalidType, UnsupportedAction,
 *         InvalidDefault
 */
Resolver resolver_from_declarations(const Value& doc);

/// resolver_from_declarations() on a .json or .toml file.
Resolver load_declarations_file(const std::string& path);

} // namespace multiconf

#endif // MULTICONF_DECLARATIONS_HPP

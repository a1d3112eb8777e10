#include "multiconf/Declarations.hpp"
#include "multiconf/Coerce.hpp"
#include "multiconf/Errors.hpp"
#include "multiconf/Loader.hpp"
#include "multiconf/Log.hpp"

#include <algorithm>
#include <set>

namespace multiconf {

const char* const SUPPRESS_MARKER = "==SUPPRESS==";

namespace {

const char* const LABEL = "<declarations>";

const std::set<std::string>& known_fields() {
    static const std::set<std::string> fields = {
        "name", "action", "type", "required", "choices", "default", "const", "nargs", "help"
    };
    return fields;
}

std::string string_field(const std::string& name, const Value& decl,
                         const char* field, const std::string& fallback) {
    auto it = decl.find(field);
    if (it == decl.end()) return fallback;
    if (!it->is_string()) {
        throw ConfigParseError(LABEL, "item '" + name + "': '" + field + "' must be a string");
    }
    return it->get<std::string>();
}

} // namespace

GlobalDefault global_default_from_json(const Value& doc) {
    auto it = doc.find("global_default");
    if (it == doc.end() || it->is_null()) {
        return GlobalDefault::null_value();
    }
    if (it->is_string() && it->get<std::string>() == SUPPRESS_MARKER) {
        return GlobalDefault::suppress();
    }
    return GlobalDefault::value(*it);
}

ItemOptions item_options_from_json(const std::string& name, const Value& decl) {
    for (auto it = decl.begin(); it != decl.end(); ++it) {
        if (known_fields().count(it.key()) == 0) {
            throw ConfigParseError(LABEL, "item '" + name + "': unknown field '" + it.key() + "'");
        }
    }

    ItemOptions options;
    options.action = parse_action(string_field(name, decl, "action", "store"), name);

    std::string type = string_field(name, decl, "type", "str");
    const auto& builtins = builtin_coercion_names();
    if (std::find(builtins.begin(), builtins.end(), type) == builtins.end()) {
        throw InvalidType(name, "unknown type '" + type + "'");
    }
    options.type = coercion_by_name(type);

    if (auto it = decl.find("required"); it != decl.end()) {
        if (!it->is_boolean()) {
            throw ConfigParseError(LABEL, "item '" + name + "': 'required' must be a boolean");
        }
        options.required = it->get<bool>();
    }
    if (auto it = decl.find("choices"); it != decl.end()) {
        if (!it->is_array()) {
            throw ConfigParseError(LABEL, "item '" + name + "': 'choices' must be an array");
        }
        options.choices = std::vector<Value>(it->begin(), it->end());
    }
    if (auto it = decl.find("default"); it != decl.end()) {
        options.default_value = *it;
    }
    if (auto it = decl.find("const"); it != decl.end()) {
        options.const_value = *it;
    }
    if (auto it = decl.find("nargs"); it != decl.end()) {
        options.nargs = display(*it);
    }
    options.help = string_field(name, decl, "help", "");
    return options;
}

Resolver resolver_from_declarations(const Value& doc) {
    if (!doc.is_object()) {
        throw ConfigParseError(LABEL, "top level must be an object");
    }

    Resolver resolver(global_default_from_json(doc));

    auto items = doc.find("items");
    if (items == doc.end()) {
        return resolver;
    }
    if (!items->is_array()) {
        throw ConfigParseError(LABEL, "'items' must be an array");
    }

    for (const auto& decl : *items) {
        if (!decl.is_object() || !decl.contains("name") || !decl["name"].is_string()) {
            throw ConfigParseError(LABEL, "every item needs a string 'name'");
        }
        const std::string name = decl["name"].get<std::string>();
        resolver.register_item(name, item_options_from_json(name, decl));
    }
    logger()->debug("declared {} config item(s)", resolver.items().size());
    return resolver;
}

Resolver load_declarations_file(const std::string& path) {
    return resolver_from_declarations(load_document_file(path));
}

} // namespace multiconf

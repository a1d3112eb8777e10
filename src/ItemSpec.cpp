#include "multiconf/ItemSpec.hpp"
#include "multiconf/Errors.hpp"

#include <algorithm>
#include <regex>
#include <stdexcept>

namespace multiconf {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

void reject_nargs(const std::string& name, const ItemOptions& options) {
    if (options.nargs.has_value()) {
        throw UnsupportedAction(name, to_string(options.action),
                                "'nargs' argument has not been implemented");
    }
}

void reject_const(const std::string& name, const ItemOptions& options) {
    if (options.const_value.has_value()) {
        throw UnsupportedAction(name, to_string(options.action),
                                "'const' argument has not been implemented");
    }
}

void reject_required(const std::string& name, const ItemOptions& options) {
    if (options.required) {
        throw UnsupportedAction(name, to_string(options.action),
                                "'required' is not supported; the item always has a value");
    }
}

Slot optional_slot(const std::optional<Value>& v) {
    return v.has_value() ? Slot::of(*v) : Slot::absent();
}

Rule make_rule(const std::string& name, const ItemOptions& options) {
    reject_nargs(name, options);

    switch (options.action) {
        case Action::store:
            reject_const(name, options);
            return StoreRule{options.type, options.choices, optional_slot(options.default_value)};

        case Action::append:
            reject_const(name, options);
            if (options.default_value.has_value() && !options.default_value->is_array()) {
                throw InvalidDefault(name, "array", *options.default_value);
            }
            return AppendRule{options.type, options.choices, optional_slot(options.default_value)};

        case Action::store_const:
            reject_required(name, options);
            if (!options.const_value.has_value()) {
                throw UnsupportedAction(name, to_string(options.action),
                                        "'const' argument is required");
            }
            return StoreConstRule{*options.const_value, optional_slot(options.default_value)};

        case Action::store_true:
            reject_required(name, options);
            reject_const(name, options);
            return StoreConstRule{true, Slot::of(options.default_value.value_or(false))};

        case Action::store_false:
            reject_required(name, options);
            reject_const(name, options);
            return StoreConstRule{false, Slot::of(options.default_value.value_or(true))};

        case Action::count:
            reject_const(name, options);
            if (options.default_value.has_value() && !options.default_value->is_number()) {
                throw InvalidDefault(name, "number", *options.default_value);
            }
            return CountRule{optional_slot(options.default_value)};
    }
    throw UnsupportedAction(name, "?", "unknown action");
}

Value add_numbers(const Value& a, const Value& b) {
    if (a.is_number_float() || b.is_number_float()) {
        return a.get<double>() + b.get<double>();
    }
    return a.get<int64_t>() + b.get<int64_t>();
}

} // namespace

std::string to_string(Action action) {
    switch (action) {
        case Action::store:       return "store";
        case Action::store_const: return "store_const";
        case Action::store_true:  return "store_true";
        case Action::store_false: return "store_false";
        case Action::append:      return "append";
        case Action::count:       return "count";
    }
    return "unknown";
}

Action parse_action(const std::string& action_name, const std::string& item_name) {
    if (action_name == "store") return Action::store;
    if (action_name == "store_const") return Action::store_const;
    if (action_name == "store_true") return Action::store_true;
    if (action_name == "store_false") return Action::store_false;
    if (action_name == "append") return Action::append;
    if (action_name == "count") return Action::count;
    if (action_name == "append_const" || action_name == "extend") {
        throw UnsupportedAction(item_name, action_name, "action has not been implemented");
    }
    throw UnsupportedAction(item_name, action_name, "unknown action");
}

bool is_valid_name(const std::string& name) {
    static const std::regex identifier("[A-Za-z_][A-Za-z0-9_]*");
    return std::regex_match(name, identifier);
}

ItemSpec::ItemSpec(std::string name, const ItemOptions& options)
    : name_(std::move(name))
    , action_(options.action)
    , required_(options.required)
    , help_(options.help)
{
    if (!is_valid_name(name_)) {
        throw InvalidName(name_, "must match [A-Za-z_][A-Za-z0-9_]*");
    }
    if (!options.type) {
        throw InvalidType(name_, "'type' must be callable");
    }
    rule_ = make_rule(name_, options);
}

const Slot& ItemSpec::default_value() const noexcept {
    return std::visit([](const auto& rule) -> const Slot& { return rule.default_value; }, rule_);
}

Value ItemSpec::coerce_and_check(const Value& raw, const Coercion& type,
                                 const std::optional<std::vector<Value>>& choices) const {
    Value coerced;
    try {
        coerced = type(raw);
    } catch (const CoercionError& e) {
        if (!e.name().empty()) throw;
        throw CoercionError(name_, e.raw(), e.details());
    } catch (const ConfigError&) {
        throw;
    } catch (const std::exception& e) {
        throw CoercionError(name_, raw, e.what());
    }

    if (choices.has_value() &&
        std::find(choices->begin(), choices->end(), coerced) == choices->end()) {
        throw InvalidChoice(name_, coerced, *choices);
    }
    return coerced;
}

Slot ItemSpec::accumulate(const Slot& current, const Slot& raw) const {
    if (raw.is_absent()) {
        throw std::invalid_argument("absent raw value for config item '" + name_ + "'");
    }
    if (takes_value() && raw.is_marker()) {
        throw std::invalid_argument("config item '" + name_ + "' (action '" +
                                    to_string(action_) + "') needs a value, got a presence marker");
    }

    return std::visit(overloaded{
        [&](const StoreRule& rule) {
            return Slot::of(coerce_and_check(raw.value(), rule.type, rule.choices));
        },
        [&](const AppendRule& rule) {
            Value coerced = coerce_and_check(raw.value(), rule.type, rule.choices);
            Value list = current.has_value() ? current.value() : Value::array();
            list.push_back(std::move(coerced));
            return Slot::of(std::move(list));
        },
        [&](const StoreConstRule&) {
            return Slot::marker();
        },
        [&](const CountRule&) {
            if (!current.has_value()) return Slot::of(1);
            return Slot::of(current.value().get<int64_t>() + 1);
        }
    }, rule_);
}

Slot ItemSpec::accumulate_all(Slot current, const std::vector<Slot>& raws) const {
    for (const auto& raw : raws) {
        current = accumulate(current, raw);
    }
    return current;
}

Slot ItemSpec::apply_default(const Slot& value) const {
    return std::visit(overloaded{
        [&](const StoreRule& rule) {
            if (value.is_absent()) return rule.default_value;
            return value;
        },
        [&](const AppendRule& rule) {
            if (rule.default_value.is_absent()) return value;
            if (!value.has_value()) return rule.default_value;
            Value list = rule.default_value.value();
            for (const auto& v : value.value()) list.push_back(v);
            return Slot::of(std::move(list));
        },
        [&](const StoreConstRule& rule) {
            if (value.is_absent()) return rule.default_value;
            return Slot::of(rule.const_value);
        },
        [&](const CountRule& rule) {
            if (rule.default_value.is_absent()) return value;
            if (!value.has_value()) return rule.default_value;
            return Slot::of(add_numbers(rule.default_value.value(), value.value()));
        }
    }, rule_);
}

} // namespace multiconf

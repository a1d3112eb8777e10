/**
 * @file ItemSpec.hpp
 * @brief Declaration of one named configuration item
 *
 * An ItemSpec fixes how raw values for one item are combined across
 * sources (accumulate) and how the combined value is finalized once all
 * sources are merged (apply_default). Each action has its own rule type
 * carrying only the fields that action uses:
 *
 * | Action      | Rule           | accumulate                 | apply_default                 |
 * |-------------|----------------|----------------------------|-------------------------------|
 * | store       | StoreRule      | coerce, check, replace     | default if absent             |
 * | append      | AppendRule     | coerce, check, push back   | default prepended             |
 * | store_const | StoreConstRule | presence marker            | const if seen, else default   |
 * | store_true  | StoreConstRule | presence marker            | true if seen, else default    |
 * | store_false | StoreConstRule | presence marker            | false if seen, else default   |
 * | count       | CountRule      | 1, 2, 3, ...               | default + count               |
 */

#ifndef MULTICONF_ITEMSPEC_HPP
#define MULTICONF_ITEMSPEC_HPP

#include "multiconf/Coerce.hpp"
#include "multiconf/Value.hpp"

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace multiconf {

enum class Action {
    store,
    store_const,
    store_true,
    store_false,
    append,
    count
};

/// Action name as written in declarations, e.g. "store_true".
std::string to_string(Action action);

/**
 * @brief Map an action name to an Action
 * @param action_name Name such as "store" or "count"
 * @param item_name Item the action is for (used in the error message)
 * @throws UnsupportedAction for "append_const"/"extend" (not implemented)
 *         and for any other unknown name
 */
Action parse_action(const std::string& action_name, const std::string& item_name = "");

/**
 * @brief Registration options for an item
 *
 * Options an action does not use are ignored (type/choices for the
 * const family and count), except where the combination is rejected:
 * nargs on any action, const on anything but store_const, required on
 * the const family.
 */
struct ItemOptions {
    Action action = Action::store;
    Coercion type = coerce::as_string;
    bool required = false;
    std::optional<std::vector<Value>> choices;
    std::optional<Value> default_value;
    std::optional<Value> const_value;
    std::optional<std::string> nargs;
    std::string help;
};

struct StoreRule {
    Coercion type;
    std::optional<std::vector<Value>> choices;
    Slot default_value;
};

struct AppendRule {
    Coercion type;
    std::optional<std::vector<Value>> choices;
    Slot default_value; // always an array when present
};

struct StoreConstRule {
    Value const_value;
    Slot default_value;
};

struct CountRule {
    Slot default_value; // always a number when present
};

using Rule = std::variant<StoreRule, AppendRule, StoreConstRule, CountRule>;

/// True if name matches [A-Za-z_][A-Za-z0-9_]*
bool is_valid_name(const std::string& name);

class ItemSpec {
public:
    /**
     * @throws InvalidName, InvalidType, UnsupportedAction, InvalidDefault
     */
    ItemSpec(std::string name, const ItemOptions& options);

    const std::string& name() const noexcept { return name_; }
    Action action() const noexcept { return action_; }
    bool required() const noexcept { return required_; }
    const std::string& help() const noexcept { return help_; }
    const Rule& rule() const noexcept { return rule_; }

    /// store and append consume a value; the others only need presence.
    bool takes_value() const noexcept {
        return action_ == Action::store || action_ == Action::append;
    }

    /// Item-level default (absent if none).
    const Slot& default_value() const noexcept;

    /**
     * @brief Fold one raw value into the current accumulated value
     * @param current Accumulated value so far (absent at pass start)
     * @param raw Raw value from a source; never absent
     * @throws InvalidChoice, CoercionError
     * @throws std::invalid_argument if raw is absent, or a presence
     *         marker for an action that needs a value
     */
    Slot accumulate(const Slot& current, const Slot& raw) const;

    /// accumulate() applied left to right over raws.
    Slot accumulate_all(Slot current, const std::vector<Slot>& raws) const;

    /// Final value for the item once every source has been merged.
    Slot apply_default(const Slot& value) const;

private:
    Value coerce_and_check(const Value& raw, const Coercion& type,
                           const std::optional<std::vector<Value>>& choices) const;

    std::string name_;
    Action action_;
    bool required_;
    std::string help_;
    Rule rule_;
};

/// Items as seen by the resolver and by source snapshots.
using ItemSpecs = std::vector<std::shared_ptr<const ItemSpec>>;

} // namespace multiconf

#endif // MULTICONF_ITEMSPEC_HPP

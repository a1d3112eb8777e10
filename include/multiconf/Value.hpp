/**
 * @file Value.hpp
 * @brief Value and Slot types for configuration data
 *
 * Uses nlohmann::json as the underlying value model to support:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...})
 *
 * A Slot wraps a Value with the two states a JSON value cannot express
 * on its own: "nothing seen yet" and "seen, but without content".
 */

#ifndef MULTICONF_VALUE_HPP
#define MULTICONF_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <utility>

namespace multiconf {

/**
 * @brief JSON-like value type for configuration
 *
 * This is an alias for nlohmann::json. A JSON null is a real value
 * here (the "null" global default produces it); absence is modelled
 * by Slot, never by null.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

/**
 * @brief Render a Value for messages: strings bare, everything else as JSON.
 */
inline std::string display(const Value& val) {
    if (val.is_string()) return val.get<std::string>();
    return val.dump();
}

/**
 * @brief Tagged state of one item's value during resolution
 *
 * - absent: no source has contributed anything (and no default applied)
 * - marker: a source saw the item but carries no content
 *           (const/true/false/count actions)
 * - value:  a concrete Value, which may itself be JSON null
 *
 * Sources emit marker or value slots; the resolver starts every item
 * at absent and folds the raw slots in.
 */
class Slot {
public:
    enum class State { absent, marker, value };

    Slot() = default;

    static Slot absent() { return Slot(); }
    static Slot marker() { return Slot(State::marker, Value()); }
    static Slot of(Value v) { return Slot(State::value, std::move(v)); }

    State state() const noexcept { return state_; }
    bool is_absent() const noexcept { return state_ == State::absent; }
    bool is_marker() const noexcept { return state_ == State::marker; }
    bool has_value() const noexcept { return state_ == State::value; }

    /// Only meaningful when has_value(); null otherwise.
    const Value& value() const noexcept { return value_; }

    bool operator==(const Slot& other) const {
        return state_ == other.state_ &&
               (state_ != State::value || value_ == other.value_);
    }
    bool operator!=(const Slot& other) const { return !(*this == other); }

private:
    Slot(State s, Value v) : state_(s), value_(std::move(v)) {}

    State state_ = State::absent;
    Value value_;
};

/// Text form used in logs: "<absent>", "<present>", or the JSON dump.
inline std::string to_string(const Slot& slot) {
    switch (slot.state()) {
        case Slot::State::absent: return "<absent>";
        case Slot::State::marker: return "<present>";
        case Slot::State::value:  return slot.value().dump();
    }
    return "<unknown>";
}

} // namespace multiconf

#endif // MULTICONF_VALUE_HPP

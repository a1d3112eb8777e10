#ifndef MULTICONF_NAMESPACE_HPP
#define MULTICONF_NAMESPACE_HPP

#include "multiconf/Errors.hpp"
#include "multiconf/Value.hpp"

#include <iosfwd>
#include <map>
#include <string>
#include <vector>

namespace multiconf {

/**
 * @brief Resolved configuration: item name → final value.
 *
 * Keeps names in insertion order for iteration and export; equality is
 * structural and ignores order. A name with no entry is distinct from a
 * name mapped to JSON null.
 */
class Namespace {
public:
    Namespace() = default;

    /// Build from a JSON object (keys in the object's iteration order).
    static Namespace from_json(const Value& object);

    void set(const std::string& name, Value value);
    bool erase(const std::string& name);

    bool contains(const std::string& name) const noexcept;
    std::size_t size() const noexcept { return order_.size(); }
    bool empty() const noexcept { return order_.empty(); }

    /// @throws KeyError if name has no entry
    const Value& at(const std::string& name) const;

    template <typename T>
    T get(const std::string& name, const T& fallback) const {
        auto it = values_.find(name);
        if (it == values_.end()) return fallback;
        try {
            return it->second.get<T>();
        } catch (const nlohmann::json::type_error&) {
            return fallback;
        }
    }

    /// Names in insertion order.
    const std::vector<std::string>& names() const noexcept { return order_; }

    bool operator==(const Namespace& other) const { return values_ == other.values_; }
    bool operator!=(const Namespace& other) const { return !(*this == other); }

    // Serialization
    Value to_json() const;
    std::string to_json_string(int indent = 2) const;

    /// TOML has no null: null entries are written as empty strings.
    std::string to_toml_string() const;

private:
    std::vector<std::string> order_;
    std::map<std::string, Value> values_;
};

/// Same text as to_json_string(-1), for gtest and logging.
std::ostream& operator<<(std::ostream& os, const Namespace& ns);

} // namespace multiconf

#endif // MULTICONF_NAMESPACE_HPP

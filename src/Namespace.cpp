#include "multiconf/Namespace.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <ostream>
#include <sstream>

namespace multiconf {

// ---- JSON -> TOML (value-based construction; no raw nodes) -----------------
namespace {
    using nlohmann::json;

    // Oversize unsigned values do not fit a TOML integer; fall back to double
    template <typename Sink>
    void push_scalar(Sink&& sink, const json& v) {
        if (v.is_string()) {
            sink(v.get<std::string>());
        } else if (v.is_boolean()) {
            sink(v.get<bool>());
        } else if (v.is_number_unsigned()) {
            const auto u = v.get<std::uint64_t>();
            if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                sink(static_cast<std::int64_t>(u));
            } else {
                sink(static_cast<double>(u));
            }
        } else if (v.is_number_integer()) {
            sink(v.get<std::int64_t>());
        } else if (v.is_number_float()) {
            sink(v.get<double>());
        } else if (v.is_null()) {
            sink(std::string{""});
        } else {
            sink(v.dump());
        }
    }

    toml::array make_array_from_json(const json& a);
    toml::table make_table_from_json(const json& o);

    toml::array make_array_from_json(const json& a) {
        toml::array out;
        for (const auto& elem : a) {
            if (elem.is_object()) {
                out.push_back(make_table_from_json(elem));
            } else if (elem.is_array()) {
                out.push_back(make_array_from_json(elem));
            } else {
                push_scalar([&](auto&& x) { out.push_back(std::forward<decltype(x)>(x)); }, elem);
            }
        }
        return out;
    }

    toml::table make_table_from_json(const json& o) {
        toml::table tbl;
        for (auto it = o.begin(); it != o.end(); ++it) {
            const auto& k = it.key();
            const auto& v = it.value();
            if (v.is_object()) {
                tbl.insert(k, make_table_from_json(v));
            } else if (v.is_array()) {
                tbl.insert(k, make_array_from_json(v));
            } else {
                push_scalar([&](auto&& x) { tbl.insert(k, std::forward<decltype(x)>(x)); }, v);
            }
        }
        return tbl;
    }
} // namespace

Namespace Namespace::from_json(const Value& object) {
    Namespace ns;
    for (auto it = object.begin(); it != object.end(); ++it) {
        ns.set(it.key(), it.value());
    }
    return ns;
}

void Namespace::set(const std::string& name, Value value) {
    auto it = values_.find(name);
    if (it == values_.end()) {
        order_.push_back(name);
        values_.emplace(name, std::move(value));
    } else {
        it->second = std::move(value);
    }
}

bool Namespace::erase(const std::string& name) {
    if (values_.erase(name) == 0) return false;
    order_.erase(std::find(order_.begin(), order_.end(), name));
    return true;
}

bool Namespace::contains(const std::string& name) const noexcept {
    return values_.find(name) != values_.end();
}

const Value& Namespace::at(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        throw KeyError(name);
    }
    return it->second;
}

Value Namespace::to_json() const {
    Value out = Value::object();
    for (const auto& [name, value] : values_) {
        out[name] = value;
    }
    return out;
}

std::string Namespace::to_json_string(int indent) const {
    nlohmann::ordered_json out = nlohmann::ordered_json::object();
    for (const auto& name : order_) {
        out[name] = nlohmann::ordered_json(values_.at(name));
    }
    return out.dump(indent);
}

std::string Namespace::to_toml_string() const {
    std::ostringstream oss;
    oss << make_table_from_json(to_json());
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Namespace& ns) {
    return os << ns.to_json_string(-1);
}

} // namespace multiconf

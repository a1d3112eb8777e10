#ifndef MULTICONF_RESOLVER_HPP
#define MULTICONF_RESOLVER_HPP

#include "multiconf/ItemSpec.hpp"
#include "multiconf/Namespace.hpp"
#include "multiconf/Source.hpp"

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace multiconf {

/**
 * @brief What an item with no value after its own defaulting becomes.
 *
 * - null_value(): the item maps to JSON null (the default policy)
 * - value(v):     the item maps to v
 * - suppress():   the item gets no entry in the result at all
 */
class GlobalDefault {
public:
    enum class Kind { null_value, value, suppress };

    static GlobalDefault null_value() { return GlobalDefault(Kind::null_value, nullptr); }
    static GlobalDefault value(Value v) { return GlobalDefault(Kind::value, std::move(v)); }
    static GlobalDefault suppress() { return GlobalDefault(Kind::suppress, nullptr); }

    Kind kind() const noexcept { return kind_; }

    /// Fallback for an absent item; absent slot means "no entry".
    Slot fallback() const {
        switch (kind_) {
            case Kind::null_value: return Slot::of(nullptr);
            case Kind::value:      return Slot::of(value_);
            case Kind::suppress:   return Slot::absent();
        }
        return Slot::absent();
    }

private:
    GlobalDefault(Kind kind, Value v) : kind_(kind), value_(std::move(v)) {}

    Kind kind_;
    Value value_;
};

/**
 * @brief Merges values for registered items from registered sources.
 *
 * Sources are pulled in registration order; later sources override
 * earlier ones for store items and extend them for append/count items.
 *
 * ```cpp
 * Resolver resolver;
 * ItemOptions port;
 * port.type = coerce::as_int;
 * port.required = true;
 * resolver.register_item("port", port);
 * resolver.register_source<JsonSource>(JsonSourceOptions{"app.json"});
 * resolver.register_source<SimpleCommandLineSource>(cli_options);
 * Namespace values = resolver.resolve();
 * ```
 */
class Resolver {
public:
    explicit Resolver(GlobalDefault global_default = GlobalDefault::null_value());

    /**
     * @brief Declare an item.
     * @throws InvalidName (bad or duplicate name), InvalidType,
     *         UnsupportedAction, InvalidDefault
     */
    const ItemSpec& register_item(const std::string& name, const ItemOptions& options = {});

    /**
     * @brief Construct a source bound to the items registered so far.
     *
     * S is constructed as S(items, args...). The returned reference stays
     * valid for the resolver's lifetime.
     */
    template <typename S, typename... Args>
    S& register_source(Args&&... args) {
        auto source = std::make_unique<S>(items_, std::forward<Args>(args)...);
        S& ref = *source;
        sources_.push_back(std::move(source));
        return ref;
    }

    /**
     * @brief Merge all sources and apply defaults, without checking
     *        required items.
     * @throws InvalidChoice, CoercionError, or whatever a source throws
     */
    Namespace resolve_partial();

    /**
     * @brief resolve_partial(), then check required items.
     * @throws RequiredValueMissing naming every required item that no
     *         source provided (item defaults do not count)
     */
    Namespace resolve();

    const ItemSpecs& items() const noexcept { return items_; }
    std::size_t source_count() const noexcept { return sources_.size(); }
    const GlobalDefault& global_default() const noexcept { return global_default_; }

private:
    using Merged = std::map<std::string, Slot>;

    Merged merge_sources();
    Namespace finalize(const Merged& merged) const;
    void check_required(const Merged& merged) const;

    GlobalDefault global_default_;
    ItemSpecs items_;
    std::vector<std::unique_ptr<Source>> sources_;
    Merged merged_; // accumulated values of the last successful pass
};

} // namespace multiconf

#endif // MULTICONF_RESOLVER_HPP

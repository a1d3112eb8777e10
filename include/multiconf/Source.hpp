#ifndef MULTICONF_SOURCE_HPP
#define MULTICONF_SOURCE_HPP

#include "multiconf/ItemSpec.hpp"
#include "multiconf/Value.hpp"

#include <map>
#include <string>
#include <vector>

namespace multiconf {

/**
 * @brief Raw, uncoerced values one source observed, per item name.
 *
 * Each slot is either a Value or a presence marker, in the order the
 * source saw them. Items the source has nothing for have no entry.
 */
using RawBatch = std::map<std::string, std::vector<Slot>>;

/**
 * @brief Producer of raw values for the items it was bound to.
 *
 * Sources are created by Resolver::register_source(), which passes the
 * items registered so far as the first constructor argument. Items
 * registered later are invisible to the source.
 */
class Source {
public:
    virtual ~Source() = default;

    /**
     * @brief Raw values for this resolution pass.
     *
     * Values are *not* coerced to the item's type. Calling this again
     * returns the same content.
     */
    virtual RawBatch produce_raw_batch() = 0;
};

/**
 * @brief Apply the mapping rule to a JSON object.
 *
 * For every item whose name is a key of the object: a one-element list
 * with the value, or with a presence marker for the actions that only
 * need presence (const family, count).
 */
RawBatch raw_batch_from_mapping(const ItemSpecs& items, const Value& mapping);

/**
 * @brief Source backed by a key → value mapping the host program built.
 *
 * ```cpp
 * resolver.register_source<MappingSource>(Value{{"c1", "1"}});
 * ```
 */
class MappingSource : public Source {
public:
    /// @throws SourceConstructionError if mapping is not a JSON object
    MappingSource(ItemSpecs items, Value mapping);

    RawBatch produce_raw_batch() override;

private:
    ItemSpecs items_;
    Value mapping_;
};

} // namespace multiconf

#endif // MULTICONF_SOURCE_HPP

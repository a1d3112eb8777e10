#include "multiconf/Source.hpp"
#include "multiconf/Errors.hpp"

namespace multiconf {

RawBatch raw_batch_from_mapping(const ItemSpecs& items, const Value& mapping) {
    RawBatch batch;
    for (const auto& item : items) {
        auto it = mapping.find(item->name());
        if (it == mapping.end()) {
            continue;
        }
        Slot raw = item->takes_value() ? Slot::of(*it) : Slot::marker();
        batch[item->name()] = {raw};
    }
    return batch;
}

MappingSource::MappingSource(ItemSpecs items, Value mapping)
    : items_(std::move(items))
    , mapping_(std::move(mapping))
{
    if (!mapping_.is_object()) {
        throw SourceConstructionError("mapping source expects an object, got " +
                                      type_name(mapping_));
    }
}

RawBatch MappingSource::produce_raw_batch() {
    return raw_batch_from_mapping(items_, mapping_);
}

} // namespace multiconf

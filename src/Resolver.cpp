#include "multiconf/Resolver.hpp"
#include "multiconf/Errors.hpp"
#include "multiconf/Log.hpp"

namespace multiconf {

Resolver::Resolver(GlobalDefault global_default)
    : global_default_(std::move(global_default))
{}

const ItemSpec& Resolver::register_item(const std::string& name, const ItemOptions& options) {
    for (const auto& item : items_) {
        if (item->name() == name) {
            throw InvalidName(name, "already registered");
        }
    }
    auto item = std::make_shared<const ItemSpec>(name, options);
    items_.push_back(item);
    logger()->trace("registered config item '{}' (action '{}')", name, to_string(item->action()));
    return *item;
}

Resolver::Merged Resolver::merge_sources() {
    Merged merged;
    for (const auto& item : items_) {
        merged[item->name()] = Slot::absent();
    }

    for (std::size_t i = 0; i < sources_.size(); ++i) {
        RawBatch batch = sources_[i]->produce_raw_batch();
        logger()->debug("source #{}: values for {} item(s)", i, batch.size());

        for (const auto& item : items_) {
            auto it = batch.find(item->name());
            if (it == batch.end() || it->second.empty()) {
                continue;
            }
            Slot& current = merged[item->name()];
            current = item->accumulate_all(current, it->second);
            logger()->trace("  {} = {}", item->name(), to_string(current));
        }
    }
    return merged;
}

Namespace Resolver::finalize(const Merged& merged) const {
    Namespace values;
    for (const auto& item : items_) {
        Slot value = item->apply_default(merged.at(item->name()));
        if (value.is_absent()) {
            value = global_default_.fallback();
        }
        if (value.has_value()) {
            values.set(item->name(), value.value());
        }
    }
    return values;
}

void Resolver::check_required(const Merged& merged) const {
    std::vector<std::string> missing;
    for (const auto& item : items_) {
        if (item->required() && merged.at(item->name()).is_absent()) {
            missing.push_back(item->name());
        }
    }
    if (!missing.empty()) {
        throw RequiredValueMissing(missing);
    }
}

Namespace Resolver::resolve_partial() {
    logger()->debug("resolving {} item(s) from {} source(s)", items_.size(), sources_.size());
    Merged merged = merge_sources();
    Namespace values = finalize(merged);
    merged_ = std::move(merged);
    return values;
}

Namespace Resolver::resolve() {
    Namespace values = resolve_partial();
    check_required(merged_);
    return values;
}

} // namespace multiconf

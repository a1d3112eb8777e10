#include "multiconf/DocumentSource.hpp"
#include "multiconf/Errors.hpp"
#include "multiconf/Loader.hpp"

namespace multiconf {

namespace {

void check_exactly_one(const char* kind, const DocumentSourceOptions& options) {
    if (options.path.has_value() && options.stream != nullptr) {
        throw SourceConstructionError(std::string(kind) +
            " source: 'path' and 'stream' were both specified but only one is expected");
    }
    if (!options.path.has_value() && options.stream == nullptr) {
        throw SourceConstructionError(std::string(kind) +
            " source: one of 'path' or 'stream' must be specified");
    }
}

} // namespace

JsonSource::JsonSource(ItemSpecs items, const JsonSourceOptions& options)
    : items_(std::move(items))
{
    check_exactly_one("JSON", options);
    document_ = options.path ? load_json_file(*options.path)
                             : load_json_stream(*options.stream);
}

RawBatch JsonSource::produce_raw_batch() {
    return raw_batch_from_mapping(items_, document_);
}

TomlSource::TomlSource(ItemSpecs items, const TomlSourceOptions& options)
    : items_(std::move(items))
{
    check_exactly_one("TOML", options);
    document_ = options.path ? load_toml_file(*options.path)
                             : load_toml_stream(*options.stream);
}

RawBatch TomlSource::produce_raw_batch() {
    return raw_batch_from_mapping(items_, document_);
}

} // namespace multiconf

/**
 * @file DocumentSource.hpp
 * @brief Sources reading a flat JSON or TOML document
 *
 * The document is read once, when the source is registered, from
 * exactly one of a path or an already-open stream. Top-level keys that
 * match item names are used; other keys are ignored. Structured values
 * (arrays, objects, sub-tables) are handed to the item's coercion as is.
 */

#ifndef MULTICONF_DOCUMENTSOURCE_HPP
#define MULTICONF_DOCUMENTSOURCE_HPP

#include "multiconf/Source.hpp"

#include <istream>
#include <optional>
#include <string>

namespace multiconf {

/**
 * @brief Where a document source reads from. Set exactly one field.
 */
struct DocumentSourceOptions {
    std::optional<std::string> path;
    std::istream* stream = nullptr; // not owned; only read during construction
};

using JsonSourceOptions = DocumentSourceOptions;
using TomlSourceOptions = DocumentSourceOptions;

/**
 * @brief Config values from a JSON object document.
 *
 * ```cpp
 * std::istringstream in(R"({"c1": "v1"})");
 * resolver.register_source<JsonSource>(JsonSourceOptions{std::nullopt, &in});
 * ```
 */
class JsonSource : public Source {
public:
    /**
     * @throws SourceConstructionError if both or neither of path/stream are set
     * @throws FileNotFoundError, ConfigParseError from loading
     */
    JsonSource(ItemSpecs items, const JsonSourceOptions& options);

    RawBatch produce_raw_batch() override;

    const Value& document() const noexcept { return document_; }

private:
    ItemSpecs items_;
    Value document_;
};

/**
 * @brief Config values from a TOML document's top-level table.
 */
class TomlSource : public Source {
public:
    /// Same errors as JsonSource.
    TomlSource(ItemSpecs items, const TomlSourceOptions& options);

    RawBatch produce_raw_batch() override;

    const Value& document() const noexcept { return document_; }

private:
    ItemSpecs items_;
    Value document_;
};

} // namespace multiconf

#endif // MULTICONF_DOCUMENTSOURCE_HPP

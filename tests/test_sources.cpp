/**
 * @file test_sources.cpp
 * @brief Tests for the mapping, JSON and TOML sources
 */

#include <gtest/gtest.h>
#include "multiconf/DocumentSource.hpp"
#include "multiconf/Errors.hpp"
#include "multiconf/Resolver.hpp"
#include "multiconf/Source.hpp"

#include "TempFile.hpp"

#include <sstream>

using namespace multiconf;
using multiconf_test::TempFile;

namespace {

ItemSpecs make_items() {
    ItemOptions flag;
    flag.action = Action::store_true;

    ItemSpecs items;
    items.push_back(std::make_shared<const ItemSpec>("c1", ItemOptions{}));
    items.push_back(std::make_shared<const ItemSpec>("debug", flag));
    return items;
}

} // namespace

// ============================================================================
// Mapping rule
// ============================================================================

TEST(RawBatchFromMapping, OnlyDeclaredKeys) {
    RawBatch batch = raw_batch_from_mapping(make_items(), Value{{"c1", "v1"}, {"other", 1}});
    ASSERT_EQ(batch.size(), 1u);
    ASSERT_EQ(batch["c1"].size(), 1u);
    EXPECT_EQ(batch["c1"][0], Slot::of("v1"));
}

TEST(RawBatchFromMapping, ValuesAreNotCoerced) {
    RawBatch batch = raw_batch_from_mapping(make_items(), Value{{"c1", 0}});
    EXPECT_EQ(batch["c1"][0], Slot::of(0));
}

TEST(RawBatchFromMapping, PresenceOnlyItemsGetMarker) {
    RawBatch batch = raw_batch_from_mapping(make_items(), Value{{"debug", false}});
    ASSERT_EQ(batch["debug"].size(), 1u);
    EXPECT_TRUE(batch["debug"][0].is_marker());
}

TEST(RawBatchFromMapping, NullIsAValue) {
    RawBatch batch = raw_batch_from_mapping(make_items(), Value{{"c1", nullptr}});
    EXPECT_EQ(batch["c1"][0], Slot::of(nullptr));
}

TEST(MappingSource, RejectsNonObject) {
    EXPECT_THROW(MappingSource(make_items(), Value{1, 2}), SourceConstructionError);
}

TEST(MappingSource, RepeatableBatches) {
    MappingSource source(make_items(), Value{{"c1", "v1"}});
    EXPECT_EQ(source.produce_raw_batch(), source.produce_raw_batch());
}

// ============================================================================
// Document sources
// ============================================================================

TEST(JsonSource, FromPath) {
    TempFile file(R"({"c1": "v1", "debug": true, "unrelated": 3})");
    JsonSourceOptions options;
    options.path = file.path();
    JsonSource source(make_items(), options);

    RawBatch batch = source.produce_raw_batch();
    EXPECT_EQ(batch.size(), 2u);
    EXPECT_EQ(batch["c1"][0], Slot::of("v1"));
    EXPECT_TRUE(batch["debug"][0].is_marker());
    EXPECT_EQ(source.document()["unrelated"], 3);
}

TEST(JsonSource, FromStream) {
    std::istringstream in(R"({"c1": "v1"})");
    JsonSourceOptions options;
    options.stream = &in;
    JsonSource source(make_items(), options);
    EXPECT_EQ(source.produce_raw_batch()["c1"][0], Slot::of("v1"));
}

TEST(JsonSource, PathAndStreamAreExclusive) {
    std::istringstream in("{}");
    JsonSourceOptions options;
    options.path = "config.json";
    options.stream = &in;
    try {
        JsonSource source(make_items(), options);
        FAIL() << "expected SourceConstructionError";
    } catch (const SourceConstructionError& e) {
        EXPECT_NE(std::string(e.what()).find("only one is expected"), std::string::npos);
    }

    EXPECT_THROW(JsonSource(make_items(), JsonSourceOptions{}), SourceConstructionError);
}

TEST(JsonSource, LoadErrorsPropagate) {
    JsonSourceOptions missing;
    missing.path = "/nonexistent/multiconf/values.json";
    EXPECT_THROW(JsonSource(make_items(), missing), FileNotFoundError);

    std::istringstream in("[]");
    JsonSourceOptions not_object;
    not_object.stream = &in;
    EXPECT_THROW(JsonSource(make_items(), not_object), ConfigParseError);
}

TEST(TomlSource, FromPath) {
    TempFile file("c1 = \"v1\"\ndebug = false\n", ".toml");
    TomlSourceOptions options;
    options.path = file.path();
    TomlSource source(make_items(), options);

    RawBatch batch = source.produce_raw_batch();
    EXPECT_EQ(batch["c1"][0], Slot::of("v1"));
    EXPECT_TRUE(batch["debug"][0].is_marker());
}

TEST(TomlSource, FromStream) {
    std::istringstream in("c1 = 5\n");
    TomlSourceOptions options;
    options.stream = &in;
    TomlSource source(make_items(), options);
    EXPECT_EQ(source.produce_raw_batch()["c1"][0], Slot::of(5));
}

TEST(TomlSource, PathAndStreamAreExclusive) {
    EXPECT_THROW(TomlSource(make_items(), TomlSourceOptions{}), SourceConstructionError);
}

// ============================================================================
// Through a resolver
// ============================================================================

TEST(DocumentSources, LaterFileOverridesEarlier) {
    Resolver resolver;
    ItemOptions port;
    port.type = coerce::as_int;
    resolver.register_item("port", port);
    resolver.register_item("host");

    TempFile base(R"({"port": 80, "host": "a"})");
    TempFile local("port = 8080\n", ".toml");

    JsonSourceOptions json_options;
    json_options.path = base.path();
    TomlSourceOptions toml_options;
    toml_options.path = local.path();
    resolver.register_source<JsonSource>(json_options);
    resolver.register_source<TomlSource>(toml_options);

    Namespace ns = resolver.resolve();
    EXPECT_EQ(ns.at("port"), 8080);
    EXPECT_EQ(ns.at("host"), "a");
}

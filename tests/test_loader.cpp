/**
 * @file test_loader.cpp
 * @brief Tests for document loading
 *
 * Tests cover:
 * - JSON file and stream loading
 * - TOML file and stream loading, nested tables and dates
 * - Auto-detection by extension
 * - Error reporting for missing files, syntax errors and non-object
 *   documents
 */

#include <gtest/gtest.h>
#include "multiconf/Errors.hpp"
#include "multiconf/Loader.hpp"

#include "TempFile.hpp"

#include <sstream>

using namespace multiconf;
using multiconf_test::TempFile;

// ============================================================================
// JSON
// ============================================================================

TEST(LoadJson, FlatObject) {
    TempFile file(R"({
        "c1": "v1",
        "port": 8080,
        "debug": true,
        "tags": ["a", "b"]
    })");

    Value doc = load_json_file(file.path());
    ASSERT_TRUE(doc.is_object());
    EXPECT_EQ(doc["c1"], "v1");
    EXPECT_EQ(doc["port"], 8080);
    EXPECT_EQ(doc["debug"], true);
    EXPECT_EQ(doc["tags"], (Value{"a", "b"}));
}

TEST(LoadJson, NullPreserved) {
    TempFile file(R"({"nullable": null})");
    Value doc = load_json_file(file.path());
    ASSERT_TRUE(doc.contains("nullable"));
    EXPECT_TRUE(doc["nullable"].is_null());
}

TEST(LoadJson, EmptyObject) {
    TempFile file("{}");
    EXPECT_TRUE(load_json_file(file.path()).empty());
}

TEST(LoadJson, MissingFile) {
    try {
        load_json_file("/nonexistent/multiconf/config.json");
        FAIL() << "expected FileNotFoundError";
    } catch (const FileNotFoundError& e) {
        EXPECT_EQ(e.path(), "/nonexistent/multiconf/config.json");
    }
}

TEST(LoadJson, InvalidSyntax) {
    TempFile file("{ invalid json }");
    try {
        load_json_file(file.path());
        FAIL() << "expected ConfigParseError";
    } catch (const ConfigParseError& e) {
        EXPECT_EQ(e.file(), file.path());
    }

    TempFile truncated(R"({"key": "value)");
    EXPECT_THROW(load_json_file(truncated.path()), ConfigParseError);
}

TEST(LoadJson, TopLevelMustBeObject) {
    TempFile file("[1, 2, 3]");
    EXPECT_THROW(load_json_file(file.path()), ConfigParseError);

    std::istringstream scalar("42");
    EXPECT_THROW(load_json_stream(scalar), ConfigParseError);
}

TEST(LoadJson, FromStream) {
    std::istringstream in(R"({"c1": "v1"})");
    Value doc = load_json_stream(in);
    EXPECT_EQ(doc["c1"], "v1");
}

TEST(LoadJson, StreamErrorUsesLabel) {
    std::istringstream in("{");
    try {
        load_json_stream(in, "<inline>");
        FAIL() << "expected ConfigParseError";
    } catch (const ConfigParseError& e) {
        EXPECT_EQ(e.file(), "<inline>");
    }
}

// ============================================================================
// TOML
// ============================================================================

TEST(LoadToml, ScalarsAndArrays) {
    TempFile file(
        "c1 = \"v1\"\n"
        "port = 8080\n"
        "ratio = 0.5\n"
        "debug = false\n"
        "tags = [\"a\", \"b\"]\n",
        ".toml");

    Value doc = load_toml_file(file.path());
    EXPECT_EQ(doc["c1"], "v1");
    EXPECT_EQ(doc["port"], 8080);
    EXPECT_DOUBLE_EQ(doc["ratio"].get<double>(), 0.5);
    EXPECT_EQ(doc["debug"], false);
    EXPECT_EQ(doc["tags"], (Value{"a", "b"}));
}

TEST(LoadToml, TablesBecomeObjects) {
    TempFile file("[database]\nhost = \"localhost\"\n", ".toml");
    Value doc = load_toml_file(file.path());
    ASSERT_TRUE(doc["database"].is_object());
    EXPECT_EQ(doc["database"]["host"], "localhost");
}

TEST(LoadToml, DatesBecomeStrings) {
    TempFile file("day = 2024-01-15\n", ".toml");
    Value doc = load_toml_file(file.path());
    ASSERT_TRUE(doc["day"].is_string());
    EXPECT_EQ(doc["day"], "2024-01-15");
}

TEST(LoadToml, InvalidSyntax) {
    TempFile file("c1 = = \"v1\"\n", ".toml");
    try {
        load_toml_file(file.path());
        FAIL() << "expected ConfigParseError";
    } catch (const ConfigParseError& e) {
        EXPECT_EQ(e.file(), file.path());
        EXPECT_NE(e.details().find("line 1"), std::string::npos);
    }
}

TEST(LoadToml, MissingFile) {
    EXPECT_THROW(load_toml_file("/nonexistent/multiconf/config.toml"), FileNotFoundError);
}

TEST(LoadToml, FromStream) {
    std::istringstream in("c1 = \"v1\"\ncount = 3\n");
    Value doc = load_toml_stream(in);
    EXPECT_EQ(doc["c1"], "v1");
    EXPECT_EQ(doc["count"], 3);
}

// ============================================================================
// Auto-detect
// ============================================================================

TEST(LoadDocument, ByExtension) {
    TempFile json_file(R"({"c1": "from json"})", ".json");
    TempFile toml_file("c1 = \"from toml\"\n", ".toml");
    TempFile upper_file(R"({"c1": "upper"})", ".JSON");

    EXPECT_EQ(load_document_file(json_file.path())["c1"], "from json");
    EXPECT_EQ(load_document_file(toml_file.path())["c1"], "from toml");
    EXPECT_EQ(load_document_file(upper_file.path())["c1"], "upper");
}

TEST(LoadDocument, UnsupportedExtension) {
    TempFile file("c1: v1\n", ".yaml");
    try {
        load_document_file(file.path());
        FAIL() << "expected ConfigError";
    } catch (const ConfigParseError&) {
        FAIL() << "extension check should come before parsing";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find(".yaml"), std::string::npos);
    }
}

TEST(LoadDocument, MissingFile) {
    EXPECT_THROW(load_document_file("/nonexistent/multiconf/config.json"), FileNotFoundError);
}

TEST(FileExtension, Lowercased) {
    EXPECT_EQ(get_file_extension("/etc/app/Config.TOML"), ".toml");
    EXPECT_EQ(get_file_extension("settings.json"), ".json");
    EXPECT_EQ(get_file_extension("Makefile"), "");
}

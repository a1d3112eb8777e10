/**
 * @file test_coerce.cpp
 * @brief Unit tests for text parsing and the built-in coercions (GoogleTest)
 *
 * parse_value() is what KEY=VALUE overrides and the "auto" type go
 * through:
 * - Only "true"/"false" for booleans (any case)
 * - Only "null" for null
 * - JSON arrays/objects when they parse, raw string otherwise
 * - Double quotes only (not single quotes)
 */

#include <gtest/gtest.h>
#include "multiconf/Coerce.hpp"
#include "multiconf/Errors.hpp"
#include "multiconf/Value.hpp"

using namespace multiconf;

// ============================================================================
// parse_value
// ============================================================================

TEST(ParseBoolean, TrueFalse) {
    EXPECT_EQ(parse_value("true"), true);
    EXPECT_EQ(parse_value("True"), true);
    EXPECT_EQ(parse_value("FALSE"), false);
}

TEST(ParseBoolean, NumericNotBoolean) {
    EXPECT_EQ(parse_value("1"), 1);
    EXPECT_EQ(parse_value("0"), 0);
    EXPECT_EQ(parse_value("yes"), "yes");
}

TEST(ParseNull, NullValues) {
    EXPECT_TRUE(parse_value("null").is_null());
    EXPECT_TRUE(parse_value("NULL").is_null());
    EXPECT_EQ(parse_value("none"), "none");
}

TEST(ParseInteger, SignedIntegers) {
    EXPECT_EQ(parse_value("42"), 42);
    EXPECT_EQ(parse_value("-12345"), -12345);
    EXPECT_TRUE(parse_value("9223372036854775807").is_number_integer());
}

TEST(ParseFloat, SimpleFloats) {
    EXPECT_DOUBLE_EQ(parse_value("3.14").get<double>(), 3.14);
    EXPECT_DOUBLE_EQ(parse_value("-0.5").get<double>(), -0.5);
    EXPECT_DOUBLE_EQ(parse_value("1.5e-3").get<double>(), 1.5e-3);
}

TEST(ParseJson, ArraysAndObjects) {
    Value arr = parse_value("[1, 2, 3]");
    ASSERT_TRUE(arr.is_array());
    EXPECT_EQ(arr.size(), 3u);

    Value obj = parse_value(R"({"outer": {"inner": 42}})");
    ASSERT_TRUE(obj.is_object());
    EXPECT_EQ(obj["outer"]["inner"], 42);
}

TEST(ParseString, Quoted) {
    EXPECT_EQ(parse_value("\"42\""), "42");
    EXPECT_EQ(parse_value("\"hello\\nworld\""), "hello\nworld");
    EXPECT_EQ(parse_value("'hello'"), "'hello'");
}

TEST(ParseRawString, Fallback) {
    EXPECT_EQ(parse_value(""), "");
    EXPECT_EQ(parse_value("path/to/file"), "path/to/file");
    EXPECT_EQ(parse_value("[incomplete"), "[incomplete");
    EXPECT_EQ(parse_value("{bad:json}"), "{bad:json}");
    EXPECT_EQ(parse_value("123abc"), "123abc");
}

// ============================================================================
// Built-in coercions
// ============================================================================

TEST(CoerceString, RendersNonStrings) {
    EXPECT_EQ(coerce::as_string("v1"), "v1");
    EXPECT_EQ(coerce::as_string(0), "0");
    EXPECT_EQ(coerce::as_string(true), "true");
    EXPECT_EQ(coerce::as_string(Value{1, 2}), "[1,2]");
}

TEST(CoerceInt, AcceptedForms) {
    EXPECT_EQ(coerce::as_int(7), 7);
    EXPECT_EQ(coerce::as_int("10"), 10);
    EXPECT_EQ(coerce::as_int(" -3 "), -3);
    EXPECT_EQ(coerce::as_int("+5"), 5);
    EXPECT_EQ(coerce::as_int(4.0), 4);
    EXPECT_EQ(coerce::as_int(true), 1);
}

TEST(CoerceInt, RejectedForms) {
    EXPECT_THROW(coerce::as_int("v1"), CoercionError);
    EXPECT_THROW(coerce::as_int("1.5"), CoercionError);
    EXPECT_THROW(coerce::as_int(2.5), CoercionError);
    EXPECT_THROW(coerce::as_int(nullptr), CoercionError);
    EXPECT_THROW(coerce::as_int("99999999999999999999"), CoercionError);
}

TEST(CoerceInt, ErrorCarriesRawValue) {
    try {
        coerce::as_int("abc");
        FAIL() << "expected CoercionError";
    } catch (const CoercionError& e) {
        EXPECT_EQ(e.raw(), "abc");
        EXPECT_TRUE(e.name().empty());
        EXPECT_NE(std::string(e.what()).find("'abc'"), std::string::npos);
    }
}

TEST(CoerceFloat, Values) {
    EXPECT_DOUBLE_EQ(coerce::as_float("2.5").get<double>(), 2.5);
    EXPECT_DOUBLE_EQ(coerce::as_float(3).get<double>(), 3.0);
    EXPECT_THROW(coerce::as_float("2.5x"), CoercionError);
    EXPECT_THROW(coerce::as_float(""), CoercionError);
}

TEST(CoerceBool, Values) {
    EXPECT_EQ(coerce::as_bool("yes"), true);
    EXPECT_EQ(coerce::as_bool("Off"), false);
    EXPECT_EQ(coerce::as_bool(1), true);
    EXPECT_EQ(coerce::as_bool(false), false);
    EXPECT_THROW(coerce::as_bool("maybe"), CoercionError);
    EXPECT_THROW(coerce::as_bool(2), CoercionError);
}

TEST(CoerceJson, ParsesStrings) {
    EXPECT_EQ(coerce::as_json("[1,2]"), (Value{1, 2}));
    EXPECT_EQ(coerce::as_json(Value{{"a", 1}}), (Value{{"a", 1}}));
    EXPECT_THROW(coerce::as_json("{nope"), CoercionError);
}

TEST(CoerceWords, SplitsOnWhitespace) {
    EXPECT_EQ(coerce::split_words("a  b\tc"), (Value{"a", "b", "c"}));
    EXPECT_EQ(coerce::split_words(""), Value::array());
    EXPECT_THROW(coerce::split_words(3), CoercionError);
}

TEST(CoerceAuto, GuessesFromText) {
    EXPECT_EQ(coerce::as_auto("8080"), 8080);
    EXPECT_EQ(coerce::as_auto("true"), true);
    EXPECT_EQ(coerce::as_auto(Value{1}), Value{1});
}

TEST(CoercePath, Normalizes) {
    EXPECT_EQ(coerce::as_path("a/./b/../c"), "a/c");
    EXPECT_THROW(coerce::as_path(1), CoercionError);
}

TEST(CoercionByName, Lookup) {
    for (const auto& name : builtin_coercion_names()) {
        EXPECT_TRUE(static_cast<bool>(coercion_by_name(name))) << name;
    }
    EXPECT_EQ(coercion_by_name("int")("12"), 12);
    EXPECT_THROW(coercion_by_name("decimal"), InvalidType);
}

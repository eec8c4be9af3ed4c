#include "reqbind/core/key_scanner.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

using reqbind::decode_limits;
using reqbind::error_code;
using reqbind::key_set;
using reqbind::json::scan_keys;
using reqbind::json::skip_value;

namespace {

key_set keys_of(std::string_view src) {
    auto res = scan_keys(src);
    EXPECT_TRUE(res.has_value()) << src << ": " << (res ? "" : res.error().message);
    return res ? *res : key_set{};
}

} // namespace

TEST(KeyScanner, NonObjectTopLevelIsEmpty) {
    const std::vector<std::string_view> inputs = {
        "",
        "                ",
        "null",
        "true",
        "false",
        "10",
        "-0",
        "1.5e-3",
        "\"str\"",
        "[]",
        " [ ] ",
        R"([null, true, false, 10, "one", {"two": "three"}])",
        R"([{"one": "two"}])",
        "{}",
        " { } ",
        "\r\n\t\v{}\r\n",
    };

    for (auto src : inputs) {
        EXPECT_EQ(keys_of(src), key_set{}) << src;
    }
}

TEST(KeyScanner, SingleKeyAnyValue) {
    const std::vector<std::string_view> values = {
        "null",     "true",      "false",     "0",         "-0",        "1",
        "-1",       "12",        "-12",       "1.2",       "-1.2",      "12.34",
        "-12.34",   "1.2E3",     "1.2E34",    "1.2e3",     "1.2e+3",    "1.2E+34",
        "1.2e-3",   "1.2E-34",   "1.23E45",   "1.23e-45",  "-1.2E3",    "-1.2e+34",
        "-1.23E-4", "-1.23e-45", "\"two\"",   "[\"two\"]", "{\"two\": \"three\"}",
    };

    for (auto value : values) {
        std::string src = "{\"one\": " + std::string(value) + "}";
        EXPECT_EQ(keys_of(src), (key_set{"one"})) << src;
    }
}

TEST(KeyScanner, MultipleKeys) {
    EXPECT_EQ(keys_of(R"({"one": null, "two": null})"), (key_set{"one", "two"}));
    EXPECT_EQ(keys_of(R"({"one": true, "two": true})"), (key_set{"one", "two"}));
    EXPECT_EQ(keys_of(R"({"one": 10, "two": 20})"), (key_set{"one", "two"}));
    EXPECT_EQ(keys_of(R"({"one": "three", "two": "four"})"), (key_set{"one", "two"}));
    EXPECT_EQ(keys_of(R"({"one": ["three"], "two" : ["four"]})"), (key_set{"one", "two"}));
    EXPECT_EQ(keys_of(R"({"one": ["three", "four"], "two": ["five", "six"]})"),
              (key_set{"one", "two"}));
}

TEST(KeyScanner, NestedKeysAreNotCollected) {
    auto keys =
        keys_of(R"({"one": {"three\\four": "five\\six"}, "two" : { "seven" : [ "eight" , "nine" ] } })");
    EXPECT_EQ(keys, (key_set{"one", "two"}));
    EXPECT_FALSE(keys.has("seven"));
    EXPECT_FALSE(keys.has("three\\\\four"));
}

TEST(KeyScanner, EscapedKeysAreVerbatim) {
    auto keys = keys_of(R"({"one\\two": null, "two\\three": null})");
    EXPECT_EQ(keys, (key_set{R"(one\\two)", R"(two\\three)"}));

    keys = keys_of(R"({"a\"b": 1, "é": 2})");
    EXPECT_TRUE(keys.has(R"(a\"b)"));
    EXPECT_TRUE(keys.has(R"(é)"));
}

TEST(KeyScanner, DuplicateKeysCollapse) {
    auto keys = keys_of(R"({"one": 1, "one": 2, "two": 3})");
    EXPECT_EQ(keys.size(), 2U);
}

TEST(KeyScanner, MultiByteKeys) {
    auto keys = keys_of("{\"\xC3\xA9t\xC3\xA9\": 1, \"\xF0\x9F\x98\x80\": [], \"\xE2\x82\xAC\": {}}");
    EXPECT_EQ(keys, (key_set{"\xC3\xA9t\xC3\xA9", "\xF0\x9F\x98\x80", "\xE2\x82\xAC"}));
}

TEST(KeyScanner, OuterShapeFromRecordFixture) {
    constexpr std::string_view src = R"({
	"embedStr": "embed val",
	"embedNum": 10,
	"inner": {
		"innerStr": "inner val",
		"innerNum": 20
	},
	"outerStr": "outer val"
})";
    EXPECT_EQ(keys_of(src), (key_set{"embedStr", "embedNum", "inner", "outerStr"}));
}

TEST(KeyScanner, TrailingContentIsIgnored) {
    EXPECT_EQ(keys_of(R"({"one": 1} trailing)"), (key_set{"one"}));
    EXPECT_EQ(keys_of("10 20"), key_set{});
}

TEST(KeyScanner, MalformedInput) {
    const std::vector<std::string_view> inputs = {
        "arbitrary garbage",
        "{",
        "{\"one\"",
        "{\"one\":",
        "{\"one\": }",
        "{\"one\": 1,}",
        "{\"one\" 1}",
        "{one: 1}",
        "{\"one\": 1 \"two\": 2}",
        "{\"one\": tru}",
        "{\"one\": nul}",
        "{\"one\": falsey}",
        "{\"one\": 01x}",
        "{\"one\": -}",
        "{\"one\": 1.}",
        "{\"one\": 1e}",
        "{\"one\": 1e+}",
        "{\"one\": \"unterminated}",
        "[1, 2",
        "[1 2]",
        "[,]",
    };

    for (auto src : inputs) {
        auto res = scan_keys(src);
        ASSERT_FALSE(res.has_value()) << src;
        EXPECT_EQ(res.error().code, error_code::malformed_input) << src;
        EXPECT_EQ(res.error().as_error_code(), reqbind::make_error_code(error_code::malformed_input));
    }
}

TEST(KeyScanner, MalformedInputCarriesOffsetAndFragment) {
    auto res = scan_keys(R"({"one": 1 "two": 2})");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().offset, 10U);
    EXPECT_EQ(res.error().fragment, R"("two": 2})");
    EXPECT_NE(res.error().message.find("position 10"), std::string::npos);
}

TEST(KeyScanner, UnexpectedEndOfInput) {
    auto res = scan_keys(R"({"one": [1, 2)");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, error_code::malformed_input);
    EXPECT_TRUE(res.error().fragment.empty());
    EXPECT_NE(res.error().message.find("unexpected JSON EOF"), std::string::npos);
}

TEST(KeyScanner, NestingLimit) {
    decode_limits limits;
    limits.max_nesting_depth = 3;

    auto ok = scan_keys(R"({"a": {"b": [1]}})", limits);
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, (key_set{"a"}));

    auto deep = scan_keys(R"({"a": {"b": [[1]]}})", limits);
    ASSERT_FALSE(deep.has_value());
    EXPECT_EQ(deep.error().code, error_code::nesting_too_deep);
    EXPECT_EQ(deep.error().http_status(), 400);
}

TEST(KeyScanner, SkipValueReturnsEndOffset) {
    decode_limits limits;
    constexpr std::string_view src = R"(  {"a": [1, "]"]} , 5)";

    auto end = skip_value(src, 0, limits);
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(src.substr(0, *end), R"(  {"a": [1, "]"]})");

    auto next = skip_value(src, *end + 2, limits);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(*next, src.size());
}

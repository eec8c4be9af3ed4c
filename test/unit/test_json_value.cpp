#include "reqbind/core/decoder.hpp"
#include "reqbind/core/json_value.hpp"
#include "support/test_records.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace reqbind;
using namespace reqbind::test_support;

namespace {

template <typename T> T decode_new(std::string_view src) {
    T out{};
    auto res = decode_json(src, out);
    EXPECT_TRUE(res.has_value()) << src << ": " << (res ? "" : res.error().message);
    return out;
}

} // namespace

TEST(JsonValue, SplitObjectKeepsOrderAndUnescapesKeys) {
    auto members = json::split_object(R"( {"b": 1, "ab": [1, {"x": 2}], "c\"": "v"} )",
                                      default_limits());
    ASSERT_TRUE(members.has_value());
    ASSERT_EQ(members->size(), 3U);
    EXPECT_EQ((*members)[0].key, "b");
    EXPECT_EQ((*members)[0].value, "1");
    EXPECT_EQ((*members)[1].key, "ab");
    EXPECT_EQ((*members)[1].value, R"([1, {"x": 2}])");
    EXPECT_EQ((*members)[2].key, "c\"");
    EXPECT_EQ((*members)[2].value, R"("v")");
}

TEST(JsonValue, SplitArray) {
    auto items = json::split_array(R"([ 1 , "two" , [3] , {"four": 4} ])", default_limits());
    ASSERT_TRUE(items.has_value());
    ASSERT_EQ(items->size(), 4U);
    EXPECT_EQ((*items)[0], "1");
    EXPECT_EQ((*items)[1], R"("two")");
    EXPECT_EQ((*items)[2], "[3]");
    EXPECT_EQ((*items)[3], R"({"four": 4})");

    auto empty = json::split_array(" [ ] ", default_limits());
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}

TEST(JsonValue, ReadStringDecodesEscapes) {
    auto text = json::read_string(R"("a\"b\\c\/d\b\f\n\r\t")");
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "a\"b\\c/d\b\f\n\r\t");

    auto unicode = json::read_string(R"("\u00e9\u20AC\ud83d\ude00")");
    ASSERT_TRUE(unicode.has_value());
    EXPECT_EQ(*unicode, "\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80");

    auto lone = json::read_string(R"("\ud83d!")");
    ASSERT_TRUE(lone.has_value());
    EXPECT_EQ(*lone, "\xEF\xBF\xBD!");

    EXPECT_FALSE(json::read_string(R"("\x")").has_value());
    EXPECT_FALSE(json::read_string(R"("\u12")").has_value());
    EXPECT_FALSE(json::read_string("42").has_value());
}

TEST(JsonValue, Scalars) {
    EXPECT_EQ(decode_new<int>("42"), 42);
    EXPECT_EQ(decode_new<int64_t>("-9000000000"), -9000000000LL);
    EXPECT_EQ(decode_new<uint8_t>("255"), 255);
    EXPECT_DOUBLE_EQ(decode_new<double>("1.5e3"), 1500.0);
    EXPECT_TRUE(decode_new<bool>("true"));
    EXPECT_EQ(decode_new<std::string>(R"("hi\n")"), "hi\n");

    auto raw = decode_new<bytes>(R"("YWI=")");
    ASSERT_EQ(raw.size(), 2U);
    EXPECT_EQ(raw[0], std::byte{'a'});
    EXPECT_EQ(raw[1], std::byte{'b'});
}

TEST(JsonValue, BytesAreBase64) {
    auto as_text = [](const bytes& b) {
        return std::string(reinterpret_cast<const char*>(b.data()), b.size());
    };

    EXPECT_EQ(as_text(decode_new<bytes>(R"("aGk=")")), "hi");
    EXPECT_EQ(as_text(decode_new<bytes>(R"("aA==")")), "h");
    EXPECT_EQ(as_text(decode_new<bytes>(R"("aGV5")")), "hey");
    EXPECT_EQ(as_text(decode_new<bytes>(R"("aGVs\r\nbG8=")")), "hello");
    EXPECT_TRUE(decode_new<bytes>(R"("")").empty());

    auto binary = decode_new<bytes>(R"("AP8=")");
    ASSERT_EQ(binary.size(), 2U);
    EXPECT_EQ(binary[0], std::byte{0x00});
    EXPECT_EQ(binary[1], std::byte{0xFF});

    for (std::string_view src : {R"("aGk")", R"("a===")", R"("aG=k")", R"("aGk=aGk=")", R"("a!k=")"}) {
        bytes out;
        auto res = decode_json(src, out);
        ASSERT_FALSE(res.has_value()) << src;
        EXPECT_EQ(res.error().code, error_code::conversion_failed) << src;
        EXPECT_EQ(res.error().type_name, "bytes") << src;
        EXPECT_NE(res.error().message.find("illegal base64 data"), std::string::npos) << src;
    }

    auto offset = json::decode_base64("aG!=");
    ASSERT_FALSE(offset.has_value());
    EXPECT_NE(offset.error().message.find("at input byte 2"), std::string::npos);
}

TEST(JsonValue, ScalarMismatches) {
    int num = 0;
    auto res = decode_json(R"("42")", num);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, error_code::conversion_failed);
    EXPECT_NE(res.error().message.find("expected JSON number"), std::string::npos);

    EXPECT_FALSE(decode_json("1.5", num).has_value());
    EXPECT_FALSE(decode_json("1e2", num).has_value());

    uint8_t small = 0;
    auto over = decode_json("256", small);
    ASSERT_FALSE(over.has_value());
    EXPECT_NE(over.error().message.find("value out of range"), std::string::npos);

    bool flag = false;
    EXPECT_FALSE(decode_json("1", flag).has_value());

    std::string text;
    EXPECT_FALSE(decode_json("true", text).has_value());
}

TEST(JsonValue, NullResetsOnlyNullableDestinations) {
    int num = 5;
    ASSERT_TRUE(decode_json("null", num).has_value());
    EXPECT_EQ(num, 5);

    std::optional<int> opt = 5;
    ASSERT_TRUE(decode_json("null", opt).has_value());
    EXPECT_FALSE(opt.has_value());

    std::unique_ptr<int> ptr = std::make_unique<int>(5);
    ASSERT_TRUE(decode_json("null", ptr).has_value());
    EXPECT_EQ(ptr.get(), nullptr);

    std::vector<int> seq = {1, 2};
    ASSERT_TRUE(decode_json("null", seq).has_value());
    EXPECT_TRUE(seq.empty());
}

TEST(JsonValue, Sequences) {
    EXPECT_EQ(decode_new<std::vector<int>>("[20, 30]"), (std::vector<int>{20, 30}));
    EXPECT_EQ(decode_new<std::vector<std::string>>(R"(["a", "b"])"),
              (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(decode_new<std::vector<std::vector<int>>>("[[1], [], [2, 3]]"),
              (std::vector<std::vector<int>>{{1}, {}, {2, 3}}));

    auto opts = decode_new<std::vector<std::optional<int>>>("[1, null, 3]");
    ASSERT_EQ(opts.size(), 3U);
    EXPECT_EQ(opts[0], 1);
    EXPECT_FALSE(opts[1].has_value());
    EXPECT_EQ(opts[2], 3);

    std::vector<int> seq;
    auto res = decode_json(R"([1, "two"])", seq);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().type_name, "int32");

    EXPECT_FALSE(decode_json(R"({"a": 1})", seq).has_value());
}

TEST(JsonValue, Capabilities) {
    auto raw = decode_new<raw_json>(R"( {"any": [1, 2]} )");
    EXPECT_EQ(raw.raw, R"({"any": [1, 2]})");

    auto text = decode_new<text_time>(R"("1234-01-02T03:04:05Z")");
    EXPECT_EQ(text.value, (timestamp{1234, 1, 2, 3, 4, 5}));

    text_time bad;
    auto res = decode_json(R"("garbage")", bad);
    ASSERT_FALSE(res.has_value());
    EXPECT_NE(res.error().message.find("cannot parse"), std::string::npos);

    EXPECT_FALSE(decode_json("12", bad).has_value());

    // The single-token capability does not apply to JSON.
    parsed_time parsed;
    EXPECT_FALSE(decode_json(R"("1234-01-02T03:04:05Z")", parsed).has_value());
}

TEST(JsonValue, DocumentFraming) {
    int num = 3;
    EXPECT_TRUE(decode_json("", num).has_value());
    EXPECT_TRUE(decode_json(" \n\t ", num).has_value());
    EXPECT_EQ(num, 3);

    auto trailing = decode_json("1 2", num);
    ASSERT_FALSE(trailing.has_value());
    EXPECT_EQ(trailing.error().code, error_code::malformed_input);
    EXPECT_EQ(trailing.error().offset, 2U);

    auto broken = decode_json("[1,", num);
    ASSERT_FALSE(broken.has_value());
    EXPECT_EQ(broken.error().code, error_code::malformed_input);
}

TEST(JsonValue, NestingLimit) {
    decode_limits limits;
    limits.max_nesting_depth = 2;

    std::vector<std::vector<int>> ok;
    EXPECT_TRUE(decode_json("[[1]]", ok, limits).has_value());

    std::vector<std::vector<std::vector<int>>> deep;
    auto res = decode_json("[[[1]]]", deep, limits);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, error_code::nesting_too_deep);
}

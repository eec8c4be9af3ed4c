#include "reqbind/core/result.hpp"

#include <gtest/gtest.h>
#include <string>
#include <system_error>
#include <utility>

using namespace reqbind;

TEST(Result, HasValueSuccess) {
    result<int> r = 42;
    EXPECT_TRUE(r.has_value());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
}

TEST(Result, HasValueError) {
    result<int> r = std::unexpected(conversion_failed("x", "int32"));
    EXPECT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::conversion_failed);
    EXPECT_EQ(r.error().as_error_code(), make_error_code(error_code::conversion_failed));
}

TEST(Result, VoidResult) {
    result<void> ok;
    EXPECT_TRUE(ok.has_value());

    result<void> failed = std::unexpected(invalid_destination("null pointer"));
    EXPECT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().message, "invalid destination: null pointer");
}

TEST(Result, ValueOrDefault) {
    result<std::string> r = std::unexpected(body_too_large(2, 1));
    EXPECT_EQ(r.value_or("fallback"), "fallback");

    result<std::string> good = std::string("hello");
    EXPECT_EQ(std::move(good).value(), "hello");
}

TEST(ErrorCategory, NameAndMessages) {
    const auto& cat = get_error_category();
    EXPECT_STREQ(cat.name(), "reqbind");
    EXPECT_EQ(cat.message(static_cast<int>(error_code::ok)), "success");
    EXPECT_EQ(cat.message(static_cast<int>(error_code::malformed_input)), "malformed input");
    EXPECT_EQ(cat.message(static_cast<int>(error_code::conversion_failed)), "conversion failed");
    EXPECT_EQ(cat.message(static_cast<int>(error_code::invalid_destination)), "invalid destination");
    EXPECT_EQ(cat.message(static_cast<int>(error_code::unsupported_content_type)),
              "unsupported content type");
    EXPECT_EQ(cat.message(static_cast<int>(error_code::body_too_large)), "request body too large");
    EXPECT_EQ(cat.message(static_cast<int>(error_code::nesting_too_deep)), "nesting too deep");
    EXPECT_EQ(cat.message(999), "unknown error");
}

TEST(ErrorCategory, ImplicitErrorCodeConversion) {
    std::error_code ec = error_code::malformed_input;
    EXPECT_TRUE(ec.category() == get_error_category());
    EXPECT_EQ(ec.value(), 1);
    EXPECT_EQ(ec.message(), "malformed input");
}

TEST(DecodeError, MalformedInputFragment) {
    auto err = malformed_input(7, "  }, \"b\": 2  ");
    EXPECT_EQ(err.code, error_code::malformed_input);
    EXPECT_EQ(err.offset, 7U);
    EXPECT_EQ(err.fragment, "}, \"b\": 2");
    EXPECT_EQ(err.message, "invalid JSON syntax in position 7: unexpected \"}, \"b\": 2\"");
    EXPECT_TRUE(err.input.empty());
}

TEST(DecodeError, MalformedInputAtEnd) {
    auto err = malformed_input(3, " \n ");
    EXPECT_TRUE(err.fragment.empty());
    EXPECT_EQ(err.message, "unexpected JSON EOF in position 3");
}

TEST(DecodeError, FragmentIsBounded) {
    std::string long_rest(200, 'x');
    auto err = malformed_input(0, long_rest);
    EXPECT_EQ(err.fragment.size(), MAX_FRAGMENT_LENGTH);
}

TEST(DecodeError, ConversionFailed) {
    auto err = conversion_failed("abc", "int32", "invalid syntax");
    EXPECT_EQ(err.input, "abc");
    EXPECT_EQ(err.type_name, "int32");
    EXPECT_EQ(err.message, "failed to parse \"abc\" into int32: invalid syntax");

    auto bare = conversion_failed("1", "thing");
    EXPECT_EQ(bare.message, "failed to parse \"1\" into thing");

    auto kind = unsupported_kind("1", "map");
    EXPECT_EQ(kind.code, error_code::conversion_failed);
    EXPECT_NE(kind.message.find("unsupported destination kind"), std::string::npos);
}

TEST(DecodeError, HttpStatus) {
    EXPECT_EQ(malformed_input(0, "x").http_status(), 400);
    EXPECT_EQ(malformed_query(0, "%zz").http_status(), 400);
    EXPECT_EQ(nesting_too_deep(0, 2).http_status(), 400);
    EXPECT_EQ(conversion_failed("x", "int32").http_status(), 400);
    EXPECT_EQ(unsupported_content_type("").http_status(), 400);
    EXPECT_EQ(unsupported_content_type("text/plain").http_status(), 415);
    EXPECT_EQ(body_too_large(11, 10).http_status(), 413);
    EXPECT_EQ(invalid_destination("x").http_status(), 500);
}

TEST(DecodeError, ContentTypeMessages) {
    EXPECT_EQ(unsupported_content_type("").message, "unspecified content type");
    EXPECT_EQ(unsupported_content_type("text/plain").message,
              "unsupported content type \"text/plain\"");
    EXPECT_EQ(body_too_large(11, 10).message, "request body of 11 bytes exceeds limit of 10 bytes");
}

#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace reqbind {

enum class error_code : int {
    ok = 0,
    malformed_input = 1,
    conversion_failed = 2,
    invalid_destination = 3, // reserved for callers, see invalid_destination()
    unsupported_content_type = 4,
    body_too_large = 5,
    nesting_too_deep = 6,
};

class error_category : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "reqbind"; }

    [[nodiscard]] std::string message(int ev) const override {
        using ec = error_code;
        switch (static_cast<ec>(ev)) {
        case ec::ok:
            return "success";
        case ec::malformed_input:
            return "malformed input";
        case ec::conversion_failed:
            return "conversion failed";
        case ec::invalid_destination:
            return "invalid destination";
        case ec::unsupported_content_type:
            return "unsupported content type";
        case ec::body_too_large:
            return "request body too large";
        case ec::nesting_too_deep:
            return "nesting too deep";
        default:
            return "unknown error";
        }
    }
};

inline const error_category& get_error_category() {
    static error_category const instance;
    return instance;
}

inline std::error_code make_error_code(error_code e) {
    return {static_cast<int>(e), get_error_category()};
}

// Error produced by every fallible decoding operation. Fields other than
// `code` and `message` are filled in only where they apply: `offset` and
// `fragment` for malformed input, `input` and `type_name` for failed
// conversions.
struct decode_error {
    reqbind::error_code code = error_code::ok;
    std::string message;
    size_t offset = 0;
    std::string fragment;
    std::string input;
    std::string type_name;

    [[nodiscard]] std::error_code as_error_code() const { return make_error_code(code); }

    // HTTP status a transport layer should answer with.
    [[nodiscard]] int http_status() const noexcept;

    [[nodiscard]] const std::string& what() const noexcept { return message; }
};

template <typename T> using result = std::expected<T, decode_error>;

// Longest fragment of the input copied into a malformed_input error.
constexpr size_t MAX_FRAGMENT_LENGTH = 64;

[[nodiscard]] decode_error malformed_input(size_t offset, std::string_view rest);
[[nodiscard]] decode_error malformed_query(size_t offset, std::string_view fragment);
[[nodiscard]] decode_error nesting_too_deep(size_t offset, size_t limit);
[[nodiscard]] decode_error conversion_failed(std::string_view input,
                                             std::string_view type_name,
                                             std::string_view reason = {});
[[nodiscard]] decode_error unsupported_kind(std::string_view input, std::string_view type_name);
// Not produced by the decoders themselves, whose destinations are typed
// references. Reserved for callers that resolve a destination at run time and
// find none; maps to HTTP 500.
[[nodiscard]] decode_error invalid_destination(std::string_view detail);
[[nodiscard]] decode_error unsupported_content_type(std::string_view media_type);
[[nodiscard]] decode_error body_too_large(size_t size, size_t limit);

} // namespace reqbind

namespace std {
template <> struct is_error_code_enum<reqbind::error_code> : true_type {};
} // namespace std

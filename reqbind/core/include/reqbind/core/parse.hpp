#pragma once

#include "result.hpp"
#include "traits.hpp"

#include <charconv>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace reqbind {

namespace detail {

template <typename T>
decode_error wrap_failure(std::string_view input, const decode_error& inner) {
    return conversion_failed(input, type_name<T>(), inner.message);
}

inline std::string join_tokens(std::span<const std::string> tokens) {
    std::string out;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) {
            out.push_back(',');
        }
        out.append(tokens[i]);
    }
    return out;
}

inline std::string_view conversion_reason(std::errc ec) noexcept {
    return ec == std::errc::result_out_of_range ? "value out of range" : "invalid syntax";
}

template <typename T> result<void> parse_integer(std::string_view src, T& out) {
    std::string_view digits = src;
    // from_chars rejects an explicit plus sign; accept it for signed kinds.
    if constexpr (std::is_signed_v<T>) {
        if (digits.size() > 1 && digits.front() == '+' && digits[1] != '-' && digits[1] != '+') {
            digits.remove_prefix(1);
        }
    }

    T value{};
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, 10);
    if (ec != std::errc()) {
        return std::unexpected(conversion_failed(src, type_name<T>(), conversion_reason(ec)));
    }
    if (ptr != digits.data() + digits.size()) {
        return std::unexpected(conversion_failed(src, type_name<T>(), "invalid syntax"));
    }
    out = value;
    return {};
}

template <typename T> result<void> parse_float(std::string_view src, T& out) {
    std::string_view digits = src;
    if (digits.size() > 1 && digits.front() == '+' && digits[1] != '-' && digits[1] != '+') {
        digits.remove_prefix(1);
    }

    T value{};
    auto [ptr, ec] = std::from_chars(
        digits.data(), digits.data() + digits.size(), value, std::chars_format::general);
    if (ec != std::errc()) {
        return std::unexpected(conversion_failed(src, type_name<T>(), conversion_reason(ec)));
    }
    if (ptr != digits.data() + digits.size()) {
        return std::unexpected(conversion_failed(src, type_name<T>(), "invalid syntax"));
    }
    out = value;
    return {};
}

} // namespace detail

// Converts one token into `out`. Custom capabilities win over the built-in
// rules; optional and unique_ptr slots are allocated before writing.
template <typename T> result<void> parse_scalar(std::string_view src, T& out) {
    if constexpr (token_parser<T>) {
        auto res = out.parse(src);
        if (!res) {
            return std::unexpected(detail::wrap_failure<T>(src, res.error()));
        }
        return {};
    } else if constexpr (text_unmarshaler<T>) {
        auto res = out.unmarshal_text(src);
        if (!res) {
            return std::unexpected(detail::wrap_failure<T>(src, res.error()));
        }
        return {};
    } else if constexpr (indirect_kind<T>) {
        return parse_scalar(src, indirect_traits<T>::alloc(out));
    } else if constexpr (std::same_as<T, bool>) {
        if (src == "true") {
            out = true;
            return {};
        }
        if (src == "false") {
            out = false;
            return {};
        }
        return std::unexpected(conversion_failed(src, type_name<T>(), "invalid syntax"));
    } else if constexpr (integer_kind<T>) {
        return detail::parse_integer(src, out);
    } else if constexpr (float_kind<T>) {
        return detail::parse_float(src, out);
    } else if constexpr (text_kind<T>) {
        out.assign(src);
        return {};
    } else if constexpr (bytes_kind<T>) {
        auto* first = reinterpret_cast<const std::byte*>(src.data());
        out.assign(first, first + src.size());
        return {};
    } else {
        return std::unexpected(unsupported_kind(src, type_name<T>()));
    }
}

// Absent, empty, or a single empty token.
[[nodiscard]] inline bool is_null_equivalent(std::span<const std::string> tokens) noexcept {
    return tokens.empty() || (tokens.size() == 1 && tokens.front().empty());
}

// Converts a token list into the sequence `out`. A `parse_sequence`
// capability receives the list unchanged, including an empty one. Otherwise a
// null-equivalent list resets `out`, and any other list replaces it with one
// element per token. On failure `out` keeps its previous contents.
template <typename T> result<void> parse_sequence(std::span<const std::string> src, T& out) {
    if constexpr (sequence_parser<T>) {
        auto res = out.parse_sequence(src);
        if (!res) {
            return std::unexpected(detail::wrap_failure<T>(detail::join_tokens(src), res.error()));
        }
        return {};
    } else if constexpr (indirect_kind<T>) {
        // A bulk converter behind the slot receives every list, empty ones too.
        if constexpr (!sequence_parser<unwrap_t<T>>) {
            if (is_null_equivalent(src)) {
                indirect_traits<T>::reset(out);
                return {};
            }
        }
        return parse_sequence(src, indirect_traits<T>::alloc(out));
    } else if constexpr (sequence_kind<T>) {
        if (is_null_equivalent(src)) {
            out.clear();
            return {};
        }

        using element_type = typename sequence_traits<T>::element_type;
        T buf;
        buf.reserve(src.size());
        for (const auto& token : src) {
            element_type value{};
            auto res = parse_scalar(token, value);
            if (!res) {
                return res;
            }
            buf.push_back(std::move(value));
        }
        out = std::move(buf);
        return {};
    } else {
        return std::unexpected(unsupported_kind(detail::join_tokens(src), type_name<T>()));
    }
}

template <typename T> result<void> parse_sequence(const std::vector<std::string>& src, T& out) {
    return parse_sequence(std::span<const std::string>(src), out);
}

} // namespace reqbind

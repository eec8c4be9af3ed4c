#pragma once

#include "key_scanner.hpp"
#include "limits.hpp"
#include "parse.hpp"
#include "result.hpp"
#include "traits.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace reqbind::json {

// Helpers below expect `raw` to be one validated JSON value, as produced by
// skip_value; surrounding whitespace is allowed.

struct member {
    std::string key; // unescaped
    std::string_view value;
};

[[nodiscard]] std::string_view trim(std::string_view raw) noexcept;
[[nodiscard]] bool is_null(std::string_view raw) noexcept;
[[nodiscard]] bool is_object(std::string_view raw) noexcept;
[[nodiscard]] bool is_array(std::string_view raw) noexcept;
[[nodiscard]] bool is_string(std::string_view raw) noexcept;

// Prefix of `raw` small enough to quote in an error.
[[nodiscard]] std::string_view excerpt(std::string_view raw) noexcept;

// Members of an object in document order. Duplicate keys are kept.
[[nodiscard]] result<std::vector<member>> split_object(std::string_view raw,
                                                       const decode_limits& limits);
[[nodiscard]] result<std::vector<std::string_view>> split_array(std::string_view raw,
                                                                const decode_limits& limits);

// Decodes a string literal, escapes included (\uXXXX and surrogate pairs are
// written as UTF-8).
[[nodiscard]] result<std::string> read_string(std::string_view raw);
[[nodiscard]] std::optional<bool> read_bool(std::string_view raw) noexcept;

// Standard padded base64, line breaks ignored. Byte fields travel in JSON
// this way.
[[nodiscard]] result<bytes> decode_base64(std::string_view text);
[[nodiscard]] std::optional<std::string_view> number_token(std::string_view raw) noexcept;

// Defined in decoder.hpp, which every translation unit decoding a JSON record
// (directly or through a record-typed field) must include. The decode entry
// points decode_json, json_body, source and request.hpp all include it.
template <record_type T>
result<void> decode_json_record(std::string_view raw, T& out, const decode_limits& limits);

template <typename T> decode_error type_mismatch(std::string_view raw, std::string_view expected) {
    return conversion_failed(excerpt(raw), type_name<T>(), expected);
}

// Decodes one JSON value into `out`. `null` resets optional, unique_ptr and
// sequence destinations and leaves any other destination untouched.
template <typename T>
result<void> decode_value(std::string_view raw, T& out, const decode_limits& limits) {
    raw = trim(raw);

    if constexpr (json_unmarshaler<T>) {
        auto res = out.unmarshal_json(raw);
        if (!res) {
            return std::unexpected(
                conversion_failed(excerpt(raw), type_name<T>(), res.error().message));
        }
        return {};
    } else if constexpr (indirect_kind<T>) {
        if (is_null(raw)) {
            indirect_traits<T>::reset(out);
            return {};
        }
        return decode_value(raw, indirect_traits<T>::alloc(out), limits);
    } else {
        if (is_null(raw)) {
            if constexpr (sequence_kind<T>) {
                out.clear();
            }
            return {};
        }

        if constexpr (text_unmarshaler<T>) {
            if (!is_string(raw)) {
                return std::unexpected(type_mismatch<T>(raw, "expected JSON string"));
            }
            auto text = read_string(raw);
            if (!text) {
                return std::unexpected(text.error());
            }
            auto res = out.unmarshal_text(*text);
            if (!res) {
                return std::unexpected(
                    conversion_failed(*text, type_name<T>(), res.error().message));
            }
            return {};
        } else if constexpr (std::same_as<T, bool>) {
            auto value = read_bool(raw);
            if (!value) {
                return std::unexpected(type_mismatch<T>(raw, "expected JSON boolean"));
            }
            out = *value;
            return {};
        } else if constexpr (integer_kind<T>) {
            auto token = number_token(raw);
            if (!token) {
                return std::unexpected(type_mismatch<T>(raw, "expected JSON number"));
            }
            return detail::parse_integer(*token, out);
        } else if constexpr (float_kind<T>) {
            auto token = number_token(raw);
            if (!token) {
                return std::unexpected(type_mismatch<T>(raw, "expected JSON number"));
            }
            return detail::parse_float(*token, out);
        } else if constexpr (text_kind<T> || bytes_kind<T>) {
            if (!is_string(raw)) {
                return std::unexpected(type_mismatch<T>(raw, "expected JSON string"));
            }
            auto text = read_string(raw);
            if (!text) {
                return std::unexpected(text.error());
            }
            if constexpr (text_kind<T>) {
                out = std::move(*text);
            } else {
                auto decoded = decode_base64(*text);
                if (!decoded) {
                    return std::unexpected(decoded.error());
                }
                out = std::move(*decoded);
            }
            return {};
        } else if constexpr (sequence_kind<T>) {
            if (!is_array(raw)) {
                return std::unexpected(type_mismatch<T>(raw, "expected JSON array"));
            }
            auto items = split_array(raw, limits);
            if (!items) {
                return std::unexpected(items.error());
            }

            T buf;
            buf.reserve(items->size());
            for (auto item : *items) {
                typename sequence_traits<T>::element_type value{};
                auto res = decode_value(item, value, limits);
                if (!res) {
                    return res;
                }
                buf.push_back(std::move(value));
            }
            out = std::move(buf);
            return {};
        } else if constexpr (record_type<T>) {
            return decode_json_record(raw, out, limits);
        } else {
            return std::unexpected(unsupported_kind(excerpt(raw), type_name<T>()));
        }
    }
}

// Decodes a whole document. Empty or whitespace-only input is a no-op; any
// other input must be exactly one well-formed value.
template <typename T>
result<void> decode_document(std::string_view src, T& out, const decode_limits& limits) {
    if (trim(src).empty()) {
        return {};
    }

    auto end = skip_value(src, 0, limits);
    if (!end) {
        return std::unexpected(end.error());
    }
    auto rest = src.substr(*end);
    if (!trim(rest).empty()) {
        size_t offset = *end + static_cast<size_t>(rest.find_first_not_of("\r\n\t\v "));
        return std::unexpected(malformed_input(offset, src.substr(offset)));
    }
    return decode_value(src.substr(0, *end), out, limits);
}

} // namespace reqbind::json

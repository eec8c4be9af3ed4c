#pragma once

#include "decoder.hpp"
#include "form.hpp"
#include "json_body.hpp"
#include "key_set.hpp"
#include "limits.hpp"
#include "parse.hpp"
#include "result.hpp"

#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace reqbind {

// Either nothing, a keyed source or a raw JSON source.
class source {
public:
    source() = default;
    source(form src) : input_(std::move(src)) {}
    source(json_body src) : input_(std::move(src)) {}

    [[nodiscard]] const form* as_form() const noexcept { return std::get_if<form>(&input_); }
    [[nodiscard]] const json_body* as_json() const noexcept {
        return std::get_if<json_body>(&input_);
    }
    [[nodiscard]] bool empty() const noexcept {
        return std::holds_alternative<std::monostate>(input_);
    }

    [[nodiscard]] result<key_set> keys(const decode_limits& limits = default_limits()) const {
        if (const auto* f = as_form()) {
            return f->keys();
        }
        if (const auto* j = as_json()) {
            return j->keys(limits);
        }
        return key_set{};
    }

    [[nodiscard]] result<bool> has(std::string_view key,
                                   const decode_limits& limits = default_limits()) const {
        if (const auto* f = as_form()) {
            return f->has(key);
        }
        if (const auto* j = as_json()) {
            return j->has(key, limits);
        }
        return false;
    }

    template <record_type T>
    result<void> decode(T& out, const decode_limits& limits = default_limits()) const {
        if (const auto* f = as_form()) {
            return decode_form(*f, out);
        }
        if (const auto* j = as_json()) {
            return j->decode(out, limits);
        }
        return {};
    }

private:
    std::variant<std::monostate, form, json_body> input_;
};

// Keys present at the top level of the input.
[[nodiscard]] inline result<key_set> membership(const source& src,
                                                const decode_limits& limits = default_limits()) {
    return src.keys(limits);
}

[[nodiscard]] inline key_set membership(const form& src) {
    return src.keys();
}

[[nodiscard]] inline result<key_set> membership(const json_body& src,
                                                const decode_limits& limits = default_limits()) {
    return src.keys(limits);
}

template <record_type T>
result<void> decode(const source& src, T& out, const decode_limits& limits = default_limits()) {
    return src.decode(out, limits);
}

template <typename T> result<void> decode_sequence(std::span<const std::string> tokens, T& out) {
    return parse_sequence(tokens, out);
}

} // namespace reqbind

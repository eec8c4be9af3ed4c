#pragma once

#include "decoder.hpp"
#include "key_scanner.hpp"
#include "key_set.hpp"
#include "limits.hpp"
#include "result.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace reqbind {

// Raw input source: a buffer holding nothing, whitespace, or one JSON value.
class json_body {
public:
    json_body() = default;
    explicit json_body(std::string text) : text_(std::move(text)) {}

    [[nodiscard]] std::string_view data() const noexcept { return text_; }
    [[nodiscard]] bool empty() const noexcept { return text_.empty(); }
    void zero() noexcept { text_.clear(); }

    // Top-level keys, taken verbatim.
    [[nodiscard]] result<key_set> keys(const decode_limits& limits = default_limits()) const {
        return json::scan_keys(text_, limits);
    }

    // Scans the whole buffer on every call.
    [[nodiscard]] result<bool> has(std::string_view key,
                                   const decode_limits& limits = default_limits()) const {
        auto found = keys(limits);
        if (!found) {
            return std::unexpected(found.error());
        }
        return found->has(key);
    }

    template <typename T>
    result<void> decode(T& out, const decode_limits& limits = default_limits()) const {
        return decode_json(text_, out, limits);
    }

    friend bool operator==(const json_body& a, const json_body& b) { return a.text_ == b.text_; }

private:
    std::string text_;
};

} // namespace reqbind

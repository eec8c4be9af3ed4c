#include "reqbind/core/key_scanner.hpp"
#include "reqbind/core/charset.hpp"

#include <cstdint>
#include <optional>
#include <utility>

namespace reqbind::json {

namespace {

// Number of bytes in the UTF-8 sequence starting at `pos`. Invalid or
// truncated sequences count as one byte.
size_t utf8_width(std::string_view src, size_t pos) noexcept {
    auto lead = static_cast<unsigned char>(src[pos]);
    size_t width = 1;
    if (lead >= 0xF0 && lead <= 0xF4) {
        width = 4;
    } else if (lead >= 0xE0) {
        width = lead <= 0xEF ? 3 : 1;
    } else if (lead >= 0xC2) {
        width = 2;
    }
    if (width == 1 || pos + width > src.size()) {
        return 1;
    }
    for (size_t i = 1; i < width; ++i) {
        auto c = static_cast<unsigned char>(src[pos + i]);
        if ((c & 0xC0) != 0x80) {
            return 1;
        }
    }
    return width;
}

// Single-pass structural scanner. Every method returns false after recording
// the first fault; callers unwind without looking further.
class scanner {
public:
    scanner(std::string_view src, size_t pos, size_t max_depth, bool collect) noexcept
        : src_(src), cur_(pos), max_depth_(max_depth), collect_(collect) {}

    bool top() {
        if (!next()) {
            return true;
        }
        if (peek() == '{') {
            ++cur_;
            return object();
        }
        return any();
    }

    bool any() {
        if (!next()) {
            return fail();
        }
        char c = peek();

        if (charset::digits.has(c)) {
            ++cur_;
            return number();
        }

        switch (c) {
        case '{':
            ++cur_;
            return object();
        case '[':
            ++cur_;
            return array();
        case '"':
            ++cur_;
            return string();
        case 'n':
            ++cur_;
            return literal("ull");
        case 't':
            ++cur_;
            return literal("rue");
        case 'f':
            ++cur_;
            return literal("alse");
        case '-':
            ++cur_;
            return signed_number();
        default:
            return fail();
        }
    }

    [[nodiscard]] size_t position() const noexcept { return cur_; }
    key_set take_keys() noexcept { return std::move(out_); }
    decode_error take_fault() { return std::move(*fault_); }

private:
    enum class object_state : uint8_t { before_key, after_key, after_colon, after_value, after_comma };
    enum class array_state : uint8_t { before_value, after_value, after_comma };

    bool object() {
        if (!enter()) {
            return false;
        }

        auto mode = object_state::before_key;
        while (next()) {
            switch (mode) {
            case object_state::before_key:
                if (peek() == '}') {
                    return leave();
                }
                if (peek() == '"') {
                    ++cur_;
                    if (!key()) {
                        return false;
                    }
                    mode = object_state::after_key;
                    continue;
                }
                return fail();

            case object_state::after_key:
                if (peek() == ':') {
                    ++cur_;
                    mode = object_state::after_colon;
                    continue;
                }
                return fail();

            case object_state::after_colon:
                if (!any()) {
                    return false;
                }
                mode = object_state::after_value;
                continue;

            case object_state::after_value:
                if (peek() == '}') {
                    return leave();
                }
                if (peek() == ',') {
                    ++cur_;
                    mode = object_state::after_comma;
                    continue;
                }
                return fail();

            case object_state::after_comma:
                if (peek() == '"') {
                    mode = object_state::before_key;
                    continue;
                }
                return fail();
            }
        }
        return fail();
    }

    bool array() {
        if (!enter()) {
            return false;
        }

        auto mode = array_state::before_value;
        while (next()) {
            switch (mode) {
            case array_state::before_value:
                if (peek() == ']') {
                    return leave();
                }
                if (!any()) {
                    return false;
                }
                mode = array_state::after_value;
                continue;

            case array_state::after_value:
                if (peek() == ']') {
                    return leave();
                }
                if (peek() == ',') {
                    ++cur_;
                    mode = array_state::after_comma;
                    continue;
                }
                return fail();

            case array_state::after_comma:
                if (!any()) {
                    return false;
                }
                mode = array_state::after_value;
                continue;
            }
        }
        return fail();
    }

    bool key() {
        size_t start = cur_;
        if (!string()) {
            return false;
        }
        if (collect_ && level_ == 1) {
            out_.add(src_.substr(start, cur_ - 1 - start));
        }
        return true;
    }

    // Escapes are not decoded: a backslash hides exactly the next byte.
    bool string() {
        while (more()) {
            char c = peek();
            if (c == '"') {
                ++cur_;
                return true;
            }
            if (c == '\\') {
                cur_ = cur_ + 2 <= src_.size() ? cur_ + 2 : src_.size();
                continue;
            }
            cur_ += utf8_width(src_, cur_);
        }
        return fail();
    }

    bool signed_number() {
        if (!more() || !charset::digits.has(peek())) {
            return fail();
        }
        ++cur_;
        return number();
    }

    // Called with the first integer digit already consumed.
    bool number() {
        skip_digits();

        if (more() && peek() == '.') {
            ++cur_;
            if (!more() || !charset::digits.has(peek())) {
                return fail();
            }
            skip_digits();
        }

        if (more() && charset::exponents.has(peek())) {
            ++cur_;
            if (more() && charset::signs.has(peek())) {
                ++cur_;
            }
            if (!more() || !charset::digits.has(peek())) {
                return fail();
            }
            skip_digits();
        }

        if (!more() || charset::delims.has(peek())) {
            return true;
        }
        return fail();
    }

    bool literal(std::string_view rest) {
        if (src_.substr(cur_).starts_with(rest)) {
            cur_ += rest.size();
            if (!more() || charset::delims.has(peek())) {
                return true;
            }
        }
        return fail();
    }

    void skip_digits() noexcept {
        while (more() && charset::digits.has(peek())) {
            ++cur_;
        }
    }

    bool enter() {
        if (++level_ > max_depth_) {
            if (!fault_) {
                fault_ = nesting_too_deep(cur_, max_depth_);
            }
            return false;
        }
        return true;
    }

    bool leave() noexcept {
        ++cur_;
        --level_;
        return true;
    }

    // Skips whitespace; false when the input is exhausted.
    bool next() noexcept {
        while (cur_ < src_.size()) {
            if (charset::whitespace.has(src_[cur_])) {
                ++cur_;
                continue;
            }
            return true;
        }
        return false;
    }

    [[nodiscard]] bool more() const noexcept { return cur_ < src_.size(); }
    [[nodiscard]] char peek() const noexcept { return src_[cur_]; }

    bool fail() {
        if (!fault_) {
            size_t pos = cur_ < src_.size() ? cur_ : src_.size();
            fault_ = malformed_input(pos, src_.substr(pos));
        }
        return false;
    }

    std::string_view src_;
    size_t cur_;
    size_t level_ = 0;
    size_t max_depth_;
    bool collect_;
    key_set out_;
    std::optional<decode_error> fault_;
};

} // namespace

result<key_set> scan_keys(std::string_view src) {
    return scan_keys(src, default_limits());
}

result<key_set> scan_keys(std::string_view src, const decode_limits& limits) {
    scanner scan(src, 0, limits.max_nesting_depth, true);
    if (!scan.top()) {
        return std::unexpected(scan.take_fault());
    }
    return scan.take_keys();
}

result<size_t> skip_value(std::string_view src, size_t pos, const decode_limits& limits) {
    scanner scan(src, pos, limits.max_nesting_depth, false);
    if (!scan.any()) {
        return std::unexpected(scan.take_fault());
    }
    return scan.position();
}

} // namespace reqbind::json

#include "reqbind/core/json_value.hpp"
#include "reqbind/core/charset.hpp"

#include <cstdint>
#include <string>

namespace reqbind::json {

namespace {

void skip_ws(std::string_view raw, size_t& pos) noexcept {
    while (pos < raw.size() && charset::whitespace.has(raw[pos])) {
        ++pos;
    }
}

decode_error unexpected_at(std::string_view raw, size_t pos) {
    return malformed_input(pos, raw.substr(pos < raw.size() ? pos : raw.size()));
}

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

// Reads XXXX of a \uXXXX escape starting at `pos`; -1 when malformed.
int32_t read_hex4(std::string_view raw, size_t pos) noexcept {
    if (pos + 4 > raw.size()) {
        return -1;
    }
    int32_t value = 0;
    for (size_t i = 0; i < 4; ++i) {
        int digit = hex_value(raw[pos + i]);
        if (digit < 0) {
            return -1;
        }
        value = value * 16 + digit;
    }
    return value;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

constexpr uint32_t REPLACEMENT_CHARACTER = 0xFFFD;

bool is_high_surrogate(int32_t cp) noexcept {
    return cp >= 0xD800 && cp <= 0xDBFF;
}

bool is_low_surrogate(int32_t cp) noexcept {
    return cp >= 0xDC00 && cp <= 0xDFFF;
}

// Value of one character of the standard base64 alphabet; -1 otherwise.
int base64_value(char c) noexcept {
    if (c >= 'A' && c <= 'Z') {
        return c - 'A';
    }
    if (c >= 'a' && c <= 'z') {
        return c - 'a' + 26;
    }
    if (c >= '0' && c <= '9') {
        return c - '0' + 52;
    }
    if (c == '+') {
        return 62;
    }
    if (c == '/') {
        return 63;
    }
    return -1;
}

bool is_line_break(char c) noexcept {
    return c == '\r' || c == '\n';
}

} // namespace

std::string_view trim(std::string_view raw) noexcept {
    while (!raw.empty() && charset::whitespace.has(raw.front())) {
        raw.remove_prefix(1);
    }
    while (!raw.empty() && charset::whitespace.has(raw.back())) {
        raw.remove_suffix(1);
    }
    return raw;
}

bool is_null(std::string_view raw) noexcept {
    return trim(raw) == "null";
}

bool is_object(std::string_view raw) noexcept {
    raw = trim(raw);
    return !raw.empty() && raw.front() == '{';
}

bool is_array(std::string_view raw) noexcept {
    raw = trim(raw);
    return !raw.empty() && raw.front() == '[';
}

bool is_string(std::string_view raw) noexcept {
    raw = trim(raw);
    return raw.size() >= 2 && raw.front() == '"' && raw.back() == '"';
}

std::string_view excerpt(std::string_view raw) noexcept {
    return trim(raw).substr(0, MAX_FRAGMENT_LENGTH);
}

result<std::vector<member>> split_object(std::string_view raw, const decode_limits& limits) {
    raw = trim(raw);
    if (!is_object(raw)) {
        return std::unexpected(unexpected_at(raw, 0));
    }

    std::vector<member> out;
    size_t pos = 1;
    skip_ws(raw, pos);
    if (pos < raw.size() && raw[pos] == '}') {
        return out;
    }

    while (true) {
        skip_ws(raw, pos);
        if (pos >= raw.size() || raw[pos] != '"') {
            return std::unexpected(unexpected_at(raw, pos));
        }

        auto key_end = skip_value(raw, pos, limits);
        if (!key_end) {
            return std::unexpected(key_end.error());
        }
        auto key = read_string(raw.substr(pos, *key_end - pos));
        if (!key) {
            return std::unexpected(key.error());
        }

        pos = *key_end;
        skip_ws(raw, pos);
        if (pos >= raw.size() || raw[pos] != ':') {
            return std::unexpected(unexpected_at(raw, pos));
        }
        ++pos;
        skip_ws(raw, pos);

        auto value_end = skip_value(raw, pos, limits);
        if (!value_end) {
            return std::unexpected(value_end.error());
        }
        out.push_back(member{std::move(*key), raw.substr(pos, *value_end - pos)});

        pos = *value_end;
        skip_ws(raw, pos);
        if (pos < raw.size() && raw[pos] == ',') {
            ++pos;
            continue;
        }
        if (pos < raw.size() && raw[pos] == '}') {
            return out;
        }
        return std::unexpected(unexpected_at(raw, pos));
    }
}

result<std::vector<std::string_view>> split_array(std::string_view raw,
                                                  const decode_limits& limits) {
    raw = trim(raw);
    if (!is_array(raw)) {
        return std::unexpected(unexpected_at(raw, 0));
    }

    std::vector<std::string_view> out;
    size_t pos = 1;
    skip_ws(raw, pos);
    if (pos < raw.size() && raw[pos] == ']') {
        return out;
    }

    while (true) {
        skip_ws(raw, pos);
        auto end = skip_value(raw, pos, limits);
        if (!end) {
            return std::unexpected(end.error());
        }
        out.push_back(raw.substr(pos, *end - pos));

        pos = *end;
        skip_ws(raw, pos);
        if (pos < raw.size() && raw[pos] == ',') {
            ++pos;
            continue;
        }
        if (pos < raw.size() && raw[pos] == ']') {
            return out;
        }
        return std::unexpected(unexpected_at(raw, pos));
    }
}

result<std::string> read_string(std::string_view raw) {
    raw = trim(raw);
    if (!is_string(raw)) {
        return std::unexpected(unexpected_at(raw, 0));
    }

    std::string out;
    out.reserve(raw.size() - 2);
    size_t end = raw.size() - 1;

    for (size_t pos = 1; pos < end; ++pos) {
        char c = raw[pos];
        if (c != '\\') {
            out.push_back(c);
            continue;
        }

        size_t escape = pos;
        if (++pos >= end) {
            return std::unexpected(unexpected_at(raw, escape));
        }
        switch (raw[pos]) {
        case '"':
            out.push_back('"');
            break;
        case '\\':
            out.push_back('\\');
            break;
        case '/':
            out.push_back('/');
            break;
        case 'b':
            out.push_back('\b');
            break;
        case 'f':
            out.push_back('\f');
            break;
        case 'n':
            out.push_back('\n');
            break;
        case 'r':
            out.push_back('\r');
            break;
        case 't':
            out.push_back('\t');
            break;
        case 'u': {
            int32_t cp = read_hex4(raw.substr(0, end), pos + 1);
            if (cp < 0) {
                return std::unexpected(unexpected_at(raw, escape));
            }
            pos += 4;

            if (is_high_surrogate(cp)) {
                int32_t low = -1;
                if (pos + 2 < end && raw[pos + 1] == '\\' && raw[pos + 2] == 'u') {
                    low = read_hex4(raw.substr(0, end), pos + 3);
                }
                if (is_low_surrogate(low)) {
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    pos += 6;
                } else {
                    cp = REPLACEMENT_CHARACTER;
                }
            } else if (is_low_surrogate(cp)) {
                cp = REPLACEMENT_CHARACTER;
            }
            append_utf8(out, static_cast<uint32_t>(cp));
            break;
        }
        default:
            return std::unexpected(unexpected_at(raw, escape));
        }
    }
    return out;
}

result<bytes> decode_base64(std::string_view text) {
    auto illegal = [text](size_t at) {
        return std::unexpected(conversion_failed(
            text, "bytes", "illegal base64 data at input byte " + std::to_string(at)));
    };

    bytes out;
    out.reserve(text.size() / 4 * 3);

    uint32_t quad = 0;
    size_t filled = 0;
    size_t padding = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (is_line_break(c)) {
            continue;
        }
        if (c == '=') {
            // Padding may only fill the last one or two places of a quantum.
            if (filled < 2) {
                return illegal(i);
            }
            ++padding;
            quad <<= 6;
        } else {
            int value = base64_value(c);
            if (value < 0 || padding > 0) {
                return illegal(i);
            }
            quad = (quad << 6) | static_cast<uint32_t>(value);
        }

        if (++filled < 4) {
            continue;
        }

        out.push_back(static_cast<std::byte>(quad >> 16));
        if (padding < 2) {
            out.push_back(static_cast<std::byte>((quad >> 8) & 0xFF));
        }
        if (padding < 1) {
            out.push_back(static_cast<std::byte>(quad & 0xFF));
        }
        if (padding > 0) {
            for (size_t j = i + 1; j < text.size(); ++j) {
                if (!is_line_break(text[j])) {
                    return illegal(j);
                }
            }
            return out;
        }
        quad = 0;
        filled = 0;
    }

    if (filled != 0) {
        return illegal(text.size());
    }
    return out;
}

std::optional<bool> read_bool(std::string_view raw) noexcept {
    raw = trim(raw);
    if (raw == "true") {
        return true;
    }
    if (raw == "false") {
        return false;
    }
    return std::nullopt;
}

std::optional<std::string_view> number_token(std::string_view raw) noexcept {
    raw = trim(raw);
    if (raw.empty() || !(raw.front() == '-' || charset::digits.has(raw.front()))) {
        return std::nullopt;
    }
    return raw;
}

} // namespace reqbind::json

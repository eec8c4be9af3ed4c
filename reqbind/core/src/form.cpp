#include "reqbind/core/form.hpp"

#include <utility>

namespace reqbind {

namespace {

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

// Unescapes one key or value; `base` is its offset in the whole query.
result<std::string> unescape_at(std::string_view src, size_t base) {
    std::string out;
    out.reserve(src.size());

    for (size_t i = 0; i < src.size(); ++i) {
        char c = src[i];
        if (c == '+') {
            out.push_back(' ');
            continue;
        }
        if (c != '%') {
            out.push_back(c);
            continue;
        }

        int hi = i + 1 < src.size() ? hex_value(src[i + 1]) : -1;
        int lo = i + 2 < src.size() ? hex_value(src[i + 2]) : -1;
        if (hi < 0 || lo < 0) {
            return std::unexpected(malformed_query(base + i, src.substr(i, 3)));
        }
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
    }
    return out;
}

} // namespace

result<std::string> unescape_query_component(std::string_view src) {
    return unescape_at(src, 0);
}

result<form> form::from_query(std::string_view query) {
    form out;
    auto res = out.parse(query);
    if (!res) {
        return std::unexpected(res.error());
    }
    return out;
}

result<void> form::parse(std::string_view query) {
    storage parsed;
    size_t pos = 0;

    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        size_t end = amp == std::string_view::npos ? query.size() : amp;
        auto part = query.substr(pos, end - pos);

        if (!part.empty()) {
            auto semicolon = part.find(';');
            if (semicolon != std::string_view::npos) {
                return std::unexpected(malformed_query(pos + semicolon, part.substr(semicolon)));
            }

            auto eq = part.find('=');
            auto raw_key = part.substr(0, eq);
            auto raw_value = eq == std::string_view::npos ? std::string_view{} : part.substr(eq + 1);

            auto key = unescape_at(raw_key, pos);
            if (!key) {
                return std::unexpected(key.error());
            }
            auto value = unescape_at(raw_value, eq == std::string_view::npos ? end : pos + eq + 1);
            if (!value) {
                return std::unexpected(value.error());
            }
            parsed[std::move(*key)].push_back(std::move(*value));
        }

        if (amp == std::string_view::npos) {
            break;
        }
        pos = amp + 1;
    }

    entries_ = std::move(parsed);
    return {};
}

void form::add(std::string_view key, std::string_view value) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        it = entries_.emplace(std::string(key), value_list{}).first;
    }
    it->second.emplace_back(value);
}

void form::set(std::string_view key, std::string_view value) {
    set(key, value_list{std::string(value)});
}

void form::set(std::string_view key, value_list values) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        entries_.emplace(std::string(key), std::move(values));
        return;
    }
    it->second = std::move(values);
}

void form::del(std::string_view key) {
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        entries_.erase(it);
    }
}

const form::value_list* form::find(std::string_view key) const {
    auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : &it->second;
}

std::string_view form::get(std::string_view key) const {
    const auto* values = find(key);
    if (!values || values->empty()) {
        return {};
    }
    return values->front();
}

key_set form::keys() const {
    key_set out;
    out.reserve(entries_.size());
    for (const auto& [key, values] : entries_) {
        out.add(key);
    }
    return out;
}

} // namespace reqbind

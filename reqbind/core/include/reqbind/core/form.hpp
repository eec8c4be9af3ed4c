#pragma once

#include "key_set.hpp"
#include "result.hpp"

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace reqbind {

// Keyed input source: text keys mapped to ordered lists of text values, as
// produced by URL queries and url-encoded bodies.
class form {
public:
    using value_list = std::vector<std::string>;
    using storage = std::map<std::string, value_list, std::less<>>;
    using const_iterator = storage::const_iterator;

    form() = default;
    form(std::initializer_list<storage::value_type> entries) : entries_(entries) {}

    // Parses an application/x-www-form-urlencoded string.
    [[nodiscard]] static result<form> from_query(std::string_view query);

    // Replaces the contents with the parsed query. On failure the form is
    // left unchanged.
    result<void> parse(std::string_view query);

    void add(std::string_view key, std::string_view value);
    void set(std::string_view key, std::string_view value);
    void set(std::string_view key, value_list values);
    void del(std::string_view key);
    void zero() noexcept { entries_.clear(); }

    // nullptr when the key is absent.
    [[nodiscard]] const value_list* find(std::string_view key) const;
    // First value, or empty when absent.
    [[nodiscard]] std::string_view get(std::string_view key) const;
    [[nodiscard]] bool has(std::string_view key) const { return find(key) != nullptr; }

    [[nodiscard]] key_set keys() const;

    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] const_iterator begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return entries_.end(); }

    friend bool operator==(const form& a, const form& b) { return a.entries_ == b.entries_; }

private:
    storage entries_;
};

// Decodes %XX escapes and '+' as space.
[[nodiscard]] result<std::string> unescape_query_component(std::string_view src);

} // namespace reqbind

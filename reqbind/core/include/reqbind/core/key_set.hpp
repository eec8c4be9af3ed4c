#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <unordered_set>

namespace reqbind {

struct string_hash {
    using is_transparent = void;

    size_t operator()(std::string_view sv) const noexcept {
        return std::hash<std::string_view>{}(sv);
    }
};

// Set of distinct keys answering "was this key present at the top level of
// the input". Produced by the key scanner or from a form's keys.
class key_set {
    using storage = std::unordered_set<std::string, string_hash, std::equal_to<>>;

public:
    using value_type = std::string;
    using const_iterator = storage::const_iterator;
    using iterator = const_iterator;

    key_set() = default;
    key_set(std::initializer_list<std::string_view> keys) {
        for (auto key : keys) {
            add(key);
        }
    }

    [[nodiscard]] bool has(std::string_view key) const { return keys_.find(key) != keys_.end(); }

    void add(std::string_view key) {
        if (!has(key)) {
            keys_.emplace(key);
        }
    }

    void del(std::string_view key) {
        auto it = keys_.find(key);
        if (it != keys_.end()) {
            keys_.erase(it);
        }
    }

    void reserve(size_t count) { keys_.reserve(count); }

    [[nodiscard]] size_t size() const noexcept { return keys_.size(); }
    [[nodiscard]] bool empty() const noexcept { return keys_.empty(); }

    [[nodiscard]] const_iterator begin() const noexcept { return keys_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return keys_.end(); }

    friend bool operator==(const key_set& a, const key_set& b) { return a.keys_ == b.keys_; }

private:
    storage keys_;
};

} // namespace reqbind

#pragma once

#include "schema.hpp"
#include "traits.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>

namespace reqbind {

// A decodable field of a record: its external name and the steps leading to
// its cell from the record root.
struct resolved_field {
    std::string name;
    std::vector<field_step> path;
    const value_ops* ops = nullptr;
};

using field_list = std::vector<resolved_field>;

// Name part of a tag: everything before the first comma. The exclude marker
// "-" yields an empty name.
[[nodiscard]] std::string_view tag_name(std::string_view tag) noexcept;

// Flattens declared members into fields, recursing into untagged embedded
// records. `record_name` is only used in diagnostics.
[[nodiscard]] field_list resolve_members(const member_list& members, std::string_view record_name);

// Process-wide cache of resolved fields, keyed by record type. Entries are
// never removed; concurrent first lookups may resolve the same type twice,
// and the first stored result is kept.
class field_cache {
public:
    static field_cache& instance();

    const field_list&
    resolve(std::type_index type, const member_list& members, std::string (*record_name)());

    [[nodiscard]] size_t size() const;

private:
    field_cache() = default;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::type_index, std::unique_ptr<const field_list>> entries_;
};

template <record_type T> const field_list& resolve_fields() {
    return field_cache::instance().resolve(typeid(T), declared_members<T>(), &type_name<T>);
}

} // namespace reqbind

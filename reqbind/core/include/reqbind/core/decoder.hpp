#pragma once

#include "fields.hpp"
#include "form.hpp"
#include "json_value.hpp"
#include "limits.hpp"
#include "result.hpp"
#include "traits.hpp"

#include <span>
#include <string>
#include <string_view>

namespace reqbind {

namespace detail {

// Cell at the end of `path`, or nullptr when an empty slot is in the way.
// Never allocates.
[[nodiscard]] void* peek_at(void* root, std::span<const field_step> path) noexcept;

// Cell at the end of `path`, allocating empty slots on the way.
[[nodiscard]] void* alloc_at(void* root, std::span<const field_step> path);

// Resets the field to its zero value if it is reachable without allocating.
void zero_at(void* root, const resolved_field& field);

[[nodiscard]] result<void> decode_form_field(const form& src, void* root, const resolved_field& field);
[[nodiscard]] result<void> decode_form_fields(const form& src, void* root, const field_list& fields);
[[nodiscard]] result<void> decode_json_fields(std::string_view raw,
                                              void* root,
                                              const field_list& fields,
                                              std::string_view record_name,
                                              const decode_limits& limits);

} // namespace detail

// Populates every field of `out` named in `src`. Fields with no entry are
// left untouched; the first conversion failure stops decoding and earlier
// writes are kept.
template <record_type T> result<void> decode_form(const form& src, T& out) {
    return detail::decode_form_fields(src, &out, resolve_fields<T>());
}

namespace json {

// Same over the members of one JSON object. `null` members zero their field.
template <record_type T>
result<void> decode_json_record(std::string_view raw, T& out, const decode_limits& limits) {
    return reqbind::detail::decode_json_fields(raw, &out, resolve_fields<T>(), type_name<T>(), limits);
}

} // namespace json

// Decodes a complete JSON document into any supported destination.
template <typename T>
result<void> decode_json(std::string_view src, T& out, const decode_limits& limits = default_limits()) {
    return json::decode_document(src, out, limits);
}

} // namespace reqbind

#pragma once

#include "key_set.hpp"
#include "limits.hpp"
#include "result.hpp"

#include <cstddef>
#include <string_view>

namespace reqbind::json {

// Collects the keys of the top-level object in `src` without building a value
// tree. `src` must be empty, whitespace only, or hold one JSON value; any
// top-level value other than an object yields an empty set. Keys are taken
// verbatim, escape sequences included.
//
// The returned set owns its keys, so `src` may be released afterwards, but it
// must not change while the scan runs.
[[nodiscard]] result<key_set> scan_keys(std::string_view src);
[[nodiscard]] result<key_set> scan_keys(std::string_view src, const decode_limits& limits);

// Validates and skips one JSON value starting at `pos` (leading whitespace
// allowed). Returns the offset just past the value.
[[nodiscard]] result<size_t> skip_value(std::string_view src, size_t pos, const decode_limits& limits);

} // namespace reqbind::json

#pragma once

#include <cstddef>

namespace reqbind {

struct decode_limits {
    static constexpr size_t DEFAULT_MAX_NESTING_DEPTH = 512;
    static constexpr size_t DEFAULT_MAX_BODY_SIZE = 10UL * 1024UL * 1024UL;

    size_t max_nesting_depth = DEFAULT_MAX_NESTING_DEPTH;
    size_t max_body_size = DEFAULT_MAX_BODY_SIZE;
    bool log_warnings = false;
};

// Process-wide defaults used by every overload that takes no explicit limits.
[[nodiscard]] decode_limits default_limits() noexcept;
void set_default_limits(const decode_limits& limits) noexcept;

// Overrides fields of `base` from REQBIND_MAX_DEPTH, REQBIND_MAX_BODY and
// REQBIND_LOG_WARNINGS. Unparsable values keep the base value.
[[nodiscard]] decode_limits limits_from_env(decode_limits base = {});

} // namespace reqbind

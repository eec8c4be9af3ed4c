#include "reqbind/core/limits.hpp"
#include "reqbind/core/log.hpp"

#include <atomic>
#include <charconv>
#include <cstdlib>
#include <string>
#include <string_view>

namespace reqbind {

namespace {

std::atomic<size_t> g_max_nesting_depth{decode_limits::DEFAULT_MAX_NESTING_DEPTH};
std::atomic<size_t> g_max_body_size{decode_limits::DEFAULT_MAX_BODY_SIZE};
std::atomic<bool> g_log_warnings{false};

bool read_size(const char* env_name, size_t& out) {
    const char* value = std::getenv(env_name);
    if (!value) {
        return false;
    }
    std::string_view sv(value);
    size_t parsed = 0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), parsed);
    if (ec != std::errc() || ptr != sv.data() + sv.size() || parsed == 0) {
        log::warn_always("reqbind",
                         std::string("ignoring invalid ") + env_name + "=" + std::string(sv));
        return false;
    }
    out = parsed;
    return true;
}

} // namespace

decode_limits default_limits() noexcept {
    decode_limits limits;
    limits.max_nesting_depth = g_max_nesting_depth.load(std::memory_order_relaxed);
    limits.max_body_size = g_max_body_size.load(std::memory_order_relaxed);
    limits.log_warnings = g_log_warnings.load(std::memory_order_relaxed);
    return limits;
}

void set_default_limits(const decode_limits& limits) noexcept {
    g_max_nesting_depth.store(limits.max_nesting_depth, std::memory_order_relaxed);
    g_max_body_size.store(limits.max_body_size, std::memory_order_relaxed);
    g_log_warnings.store(limits.log_warnings, std::memory_order_relaxed);
}

decode_limits limits_from_env(decode_limits base) {
    size_t value = 0;
    if (read_size("REQBIND_MAX_DEPTH", value)) {
        base.max_nesting_depth = value;
    }
    if (read_size("REQBIND_MAX_BODY", value)) {
        base.max_body_size = value;
    }
    if (const char* flag = std::getenv("REQBIND_LOG_WARNINGS")) {
        std::string_view sv(flag);
        base.log_warnings = !(sv.empty() || sv == "0" || sv == "false");
    }
    return base;
}

} // namespace reqbind

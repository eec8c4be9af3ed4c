#include "reqbind/core/log.hpp"
#include "reqbind/core/limits.hpp"

#include <iostream>
#include <mutex>

namespace reqbind::log {

namespace {

std::mutex g_stderr_mutex;

} // namespace

void warn(std::string_view component, std::string_view message) {
    if (!default_limits().log_warnings) {
        return;
    }
    warn_always(component, message);
}

void warn_always(std::string_view component, std::string_view message) {
    std::lock_guard<std::mutex> lock(g_stderr_mutex);
    std::cerr << "[" << component << "] " << message << "\n";
}

} // namespace reqbind::log

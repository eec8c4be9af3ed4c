#pragma once

#include <string_view>

namespace reqbind::log {

// Writes "[component] message" to stderr when warnings are enabled in the
// default limits.
void warn(std::string_view component, std::string_view message);

// Same, regardless of configuration.
void warn_always(std::string_view component, std::string_view message);

} // namespace reqbind::log

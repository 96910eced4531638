#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace TS {

// ISO-8601 in UTC with milliseconds, e.g. 2024-05-01T12:00:00.250Z.
auto format_timestamp(std::chrono::system_clock::time_point tp) -> std::string;

// Local wall-clock time rendered with a strftime pattern.
auto format_local_time(std::chrono::system_clock::time_point tp,
                       std::string_view                      pattern = "%Y-%m-%d %H:%M:%S") -> std::string;

} // namespace TS

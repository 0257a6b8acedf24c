/**
 * Runbox Time Formatting
 */
#pragma once
#include <string>
#include <chrono>

namespace runbox::util {

// ISO 8601 UTC with milliseconds, e.g. 2024-05-01T12:00:00.123Z
std::string format_iso8601(std::chrono::system_clock::time_point tp);

inline std::string now_iso8601() {
    return format_iso8601(std::chrono::system_clock::now());
}

} // namespace runbox::util

/**
 * Runbox Logger
 *
 * Installs the colour console logger as spdlog's default.
 */
#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace runbox::util {

void init_logger(const std::string& level = "info");

void set_log_level(spdlog::level::level_enum level);

// Level for a name such as "debug" or "warn"; info if unknown
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace runbox::util

#include "util/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace runbox::util {

void init_logger(const std::string& level) {
    auto console = spdlog::get("runbox");
    if (!console) {
        console = spdlog::stdout_color_mt("runbox");
    }
    spdlog::set_default_logger(console);
    spdlog::set_level(parse_log_level(level));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    if (name == "warning") {
        return spdlog::level::warn;
    }
    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

} // namespace runbox::util

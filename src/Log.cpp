#include "multiconf/Log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <stdexcept>

namespace multiconf {

namespace {

const char* const LOGGER_NAME = "multiconf";

std::shared_ptr<spdlog::logger> make_logger() {
    if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
    }
    auto created = spdlog::stderr_color_mt(LOGGER_NAME);
    created->set_level(spdlog::level::warn);
    created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    return created;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    static auto log = make_logger();
    return log;
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

void set_log_level(const std::string& level_name) {
    auto level = spdlog::level::from_str(level_name);
    // from_str maps unknown names to off; only accept "off" when asked for
    if (level == spdlog::level::off && level_name != "off") {
        throw std::invalid_argument("Unknown log level: " + level_name);
    }
    set_log_level(level);
}

} // namespace multiconf

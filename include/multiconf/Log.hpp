/**
 * @file Log.hpp
 * @brief Library logger
 *
 * All multiconf components log through one spdlog logger named
 * "multiconf", created on first use with level warn and a colored
 * stderr sink. Hosts that already configured a logger with that name
 * in the spdlog registry get theirs reused.
 */

#ifndef MULTICONF_LOG_HPP
#define MULTICONF_LOG_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace multiconf {

/// The "multiconf" logger.
std::shared_ptr<spdlog::logger> logger();

void set_log_level(spdlog::level::level_enum level);

/**
 * @brief Set the level from its name ("trace", "debug", "info", "warn",
 *        "error", "critical", "off")
 * @throws std::invalid_argument for an unknown name
 */
void set_log_level(const std::string& level_name);

} // namespace multiconf

#endif // MULTICONF_LOG_HPP

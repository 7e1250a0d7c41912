#ifndef CUT_UTILS_LOGGING_HPP
#define CUT_UTILS_LOGGING_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace cut_utils
{

/**
 * Return the registered logger with this name, creating a colored stdout
 * logger on first use.
 *
 * @param name Logger name, shown in every line it prints
 */
std::shared_ptr<spdlog::logger> getLogger(const std::string& name);

/**
 * Logger that discards everything. Not registered, so several can share a
 * name.
 */
std::shared_ptr<spdlog::logger> makeNullLogger(const std::string& name);

/**
 * Parse a level name as printed by spdlog ("trace", "debug", "info", "warn",
 * "error", "critical", "off").
 *
 * @throws std::invalid_argument for anything else
 */
spdlog::level::level_enum parseLogLevel(const std::string& levelName);

}  // namespace cut_utils

#endif  // CUT_UTILS_LOGGING_HPP

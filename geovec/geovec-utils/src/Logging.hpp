#ifndef GEOVEC_UTILS_LOGGING_HPP
#define GEOVEC_UTILS_LOGGING_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace geovec_utils
{

/// Name under which the library logger is registered with spdlog.
inline constexpr const char* LOGGER_NAME = "geovec";

/**
 * Get the shared geovec logger, creating and registering it on first use.
 *
 * The logger writes to a colour stdout sink and defaults to the warn level,
 * so the library stays silent unless something goes wrong. If spdlog fails
 * to create the sink, the failure is reported on stderr and spdlog's default
 * logger is returned instead.
 *
 * @return Shared pointer to the registered logger (never null)
 */
std::shared_ptr<spdlog::logger> getLogger();

/**
 * Apply log levels from the SPDLOG_LEVEL environment variable.
 *
 * Accepts spdlog's syntax, e.g. "warn,geovec=debug". Creates the geovec
 * logger first so a per-logger level can target it.
 */
void configureLogging();

/**
 * Set the level of the geovec logger.
 *
 * @param level Level name understood by spdlog ("trace" ... "off")
 * @throws std::invalid_argument if the name is not a known level
 */
void setLogLevel(const std::string& level);

}  // namespace geovec_utils

#endif  // GEOVEC_UTILS_LOGGING_HPP

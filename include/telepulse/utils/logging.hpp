#pragma once

#ifndef TELEPULSE_NO_LOGGING
#include <spdlog/spdlog.h>
#include <memory>

namespace telepulse::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * A single logger instance is shared by every analytics stage and can be
 * configured once at startup.
 */
class Logging {
public:
	/**
	 * @brief Gets the singleton logger instance.
	 * @return A shared pointer to the spdlog logger.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Initializes the logger with a specific logging level.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace telepulse::utils

// --- Logger Macros for convenient access ---
#define TELEPULSE_TRACE(...)    telepulse::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define TELEPULSE_DEBUG(...)    telepulse::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define TELEPULSE_INFO(...)     telepulse::utils::Logging::getLogger()->info(__VA_ARGS__)
#define TELEPULSE_WARN(...)     telepulse::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define TELEPULSE_ERROR(...)    telepulse::utils::Logging::getLogger()->error(__VA_ARGS__)
#define TELEPULSE_CRITICAL(...) telepulse::utils::Logging::getLogger()->critical(__VA_ARGS__)

#else
// No-op logging when spdlog is disabled

namespace telepulse::utils {

class Logging {
public:
	static void init() {}
};

} // namespace telepulse::utils

#define TELEPULSE_TRACE(...)    do {} while(0)
#define TELEPULSE_DEBUG(...)    do {} while(0)
#define TELEPULSE_INFO(...)     do {} while(0)
#define TELEPULSE_WARN(...)     do {} while(0)
#define TELEPULSE_ERROR(...)    do {} while(0)
#define TELEPULSE_CRITICAL(...) do {} while(0)

#endif // TELEPULSE_NO_LOGGING

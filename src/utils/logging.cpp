#include "telepulse/utils/logging.hpp"

#ifndef TELEPULSE_NO_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>

namespace telepulse::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		logger_ = spdlog::get("telepulse");
		if (!logger_) {
			logger_ = spdlog::stderr_color_mt("telepulse");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		init();
	}
	return logger_;
}

} // namespace telepulse::utils

#endif // TELEPULSE_NO_LOGGING

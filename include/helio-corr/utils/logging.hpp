#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <mutex>

namespace heliocorr::utils {

/**
 * @class Logging
 * @brief Process-wide access point to the spdlog logger used by the library.
 *
 * Analyses never hold logger state of their own; everything goes through the
 * shared instance, which callers may configure once at startup.
 */
class Logging {
public:
	/**
	 * @brief Gets the shared logger, creating it on first use. Safe to call
	 * concurrently.
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

	static void create();

	static std::shared_ptr<spdlog::logger> logger_;
	static std::once_flag create_flag_;
};

} // namespace heliocorr::utils

#define HELIOCORR_TRACE(...)    heliocorr::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define HELIOCORR_DEBUG(...)    heliocorr::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define HELIOCORR_INFO(...)     heliocorr::utils::Logging::getLogger()->info(__VA_ARGS__)
#define HELIOCORR_WARN(...)     heliocorr::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define HELIOCORR_ERROR(...)    heliocorr::utils::Logging::getLogger()->error(__VA_ARGS__)
#define HELIOCORR_CRITICAL(...) heliocorr::utils::Logging::getLogger()->critical(__VA_ARGS__)

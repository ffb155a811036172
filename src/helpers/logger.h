#ifndef MDBROKER_HELPERS_LOGGER_H
#define MDBROKER_HELPERS_LOGGER_H

#include <memory>

// clang-format off
#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>
// clang-format on

#include "../config/log_config.h"

namespace helpers
{
	/**
	 * Creates null logger which can be used as a sink.
	 * @return smart pointer to created logger
	 */
	std::shared_ptr<spdlog::logger> create_null_logger();

	/**
	 * Create the system logger writing into rotated files described by given configuration.
	 * The log directory is created if it does not exist. The logger is registered globally as "logger".
	 * @param config logging configuration
	 * @return smart pointer to created logger
	 * @throws spdlog::spdlog_ex or boost::filesystem::filesystem_error on failure
	 */
	std::shared_ptr<spdlog::logger> create_file_logger(const log_config &config);

	/**
	 * Translate a level name used in the configuration.
	 * @param lev one of off, critical, err, warn, info, debug, trace
	 * @return the level, trace for unknown names
	 */
	spdlog::level::level_enum get_log_level(const std::string &lev);
}


#endif // MDBROKER_HELPERS_LOGGER_H

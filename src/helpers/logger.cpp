#include "logger.h"

#include <map>
#include <spdlog/sinks/rotating_file_sink.h>

#define BOOST_FILESYSTEM_NO_DEPRECATED
#define BOOST_NO_CXX11_SCOPED_ENUMS
#include <boost/filesystem.hpp>
namespace fs = boost::filesystem;

std::shared_ptr<spdlog::logger> helpers::create_null_logger()
{
	// Create logger manually to avoid global registration of logger
	auto sink = std::make_shared<spdlog::sinks::null_sink_st>();
	auto logger = std::make_shared<spdlog::logger>("", sink);

	return logger;
}

std::shared_ptr<spdlog::logger> helpers::create_file_logger(const log_config &config)
{
	// Try to create target directory for logs
	auto path = fs::path(config.log_path);
	if (!path.empty() && !fs::is_directory(path)) {
		fs::create_directories(path);
	}

	auto filename = (path / (config.log_basename + "." + config.log_suffix)).string();
	auto rotating_sink =
		std::make_shared<spdlog::sinks::rotating_file_sink_mt>(filename, config.log_file_size, config.log_files_count);

	auto logger = std::make_shared<spdlog::logger>("logger", rotating_sink);
	logger->set_level(get_log_level(config.log_level));
	logger->flush_on(spdlog::level::warn);
	spdlog::register_logger(logger);

	// The file sink is buffered, make sure nothing older than a second stays in memory
	spdlog::flush_every(std::chrono::seconds(1));

	return logger;
}

spdlog::level::level_enum helpers::get_log_level(const std::string &lev)
{
	static const std::map<std::string, spdlog::level::level_enum> levels = {{"off", spdlog::level::off},
		{"critical", spdlog::level::critical},
		{"err", spdlog::level::err},
		{"warn", spdlog::level::warn},
		{"info", spdlog::level::info},
		{"debug", spdlog::level::debug},
		{"trace", spdlog::level::trace}};

	auto it = levels.find(lev);
	return it == std::end(levels) ? spdlog::level::trace : it->second;
}

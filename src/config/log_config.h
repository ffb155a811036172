#ifndef MDBROKER_LOG_CONFIG_H
#define MDBROKER_LOG_CONFIG_H

#include <cstddef>
#include <string>


/**
 * Where and how much the broker logs.
 */
struct log_config {
public:
	/** Directory of the log files, created if missing */
	std::string log_path = "/var/log/mdbroker/";
	/** Name of the active log file without extension */
	std::string log_basename = "broker";
	/** Extension of log files */
	std::string log_suffix = "log";
	/**
	 * Minimal level of logged messages.
	 * One of: off, critical, err, warn, info, debug, trace
	 */
	std::string log_level = "info";
	/** Size in bytes at which the active file is rotated */
	std::size_t log_file_size = 1024 * 1024;
	/** How many rotated files are kept */
	std::size_t log_files_count = 3;

	/**
	 * @param other compared configuration
	 * @return true if all fields are equal
	 */
	bool operator==(const log_config &other) const
	{
		return log_path == other.log_path && log_basename == other.log_basename && log_suffix == other.log_suffix &&
			log_level == other.log_level && log_file_size == other.log_file_size &&
			log_files_count == other.log_files_count;
	}

	/**
	 * @param other compared configuration
	 * @return true if any field differs
	 */
	bool operator!=(const log_config &other) const
	{
		return !(*this == other);
	}
};

#endif // MDBROKER_LOG_CONFIG_H

#include "broker_config.h"

#define BOOST_FILESYSTEM_NO_DEPRECATED
#define BOOST_NO_CXX11_SCOPED_ENUMS
#include <boost/filesystem.hpp>
namespace fs = boost::filesystem;

broker_config::broker_config(const YAML::Node &config)
{
	try {
		if (!config.IsMap()) {
			throw config_error("The configuration is not a YAML map");
		}

		if (config["address"] && config["address"].IsScalar()) {
			address_ = config["address"].as<std::string>();
		} // no throw... can be omitted
		if (config["poll_interval"] && config["poll_interval"].IsScalar()) {
			poll_interval_ = std::chrono::milliseconds(config["poll_interval"].as<std::size_t>());
		} // no throw... can be omitted
		if (config["heartbeat"] && config["heartbeat"].IsScalar()) {
			heartbeat_interval_ = std::chrono::seconds(config["heartbeat"].as<std::size_t>());
		} // no throw... can be omitted
		if (config["heartbeat_mult"] && config["heartbeat_mult"].IsScalar()) {
			heartbeat_multiplier_ = config["heartbeat_mult"].as<std::size_t>();
		} // no throw... can be omitted
		if (config["log_details"] && config["log_details"].IsScalar()) {
			log_details_ = config["log_details"].as<bool>();
		} // no throw... can be omitted
		if (config["linger"] && config["linger"].IsScalar()) {
			linger_ = std::chrono::milliseconds(config["linger"].as<std::size_t>());
		} // no throw... can be omitted

		// load logger
		if (config["logger"] && config["logger"].IsMap()) {
			if (config["logger"]["file"] && config["logger"]["file"].IsScalar()) {
				fs::path tmp = config["logger"]["file"].as<std::string>();
				log_config_.log_basename = tmp.filename().string();
				log_config_.log_path = tmp.parent_path().string();
			} // no throw... can be omitted
			if (config["logger"]["level"] && config["logger"]["level"].IsScalar()) {
				log_config_.log_level = config["logger"]["level"].as<std::string>();
			} // no throw... can be omitted
			if (config["logger"]["max-size"] && config["logger"]["max-size"].IsScalar()) {
				log_config_.log_file_size = config["logger"]["max-size"].as<std::size_t>();
			} // no throw... can be omitted
			if (config["logger"]["rotations"] && config["logger"]["rotations"].IsScalar()) {
				log_config_.log_files_count = config["logger"]["rotations"].as<std::size_t>();
			} // no throw... can be omitted
		} // no throw... can be omitted
	} catch (YAML::Exception &ex) {
		throw config_error("Broker configuration was not loaded: " + std::string(ex.what()));
	}

	if (poll_interval_.count() == 0) {
		throw config_error("Poll interval must be positive");
	}

	if (heartbeat_interval_.count() == 0) {
		throw config_error("Heartbeat interval must be positive");
	}

	if (heartbeat_multiplier_ < 1) {
		throw config_error("Heartbeat multiplier must be at least 1");
	}
}

const std::string &broker_config::get_address() const
{
	return address_;
}

std::chrono::milliseconds broker_config::get_poll_interval() const
{
	return poll_interval_;
}

std::chrono::seconds broker_config::get_heartbeat_interval() const
{
	return heartbeat_interval_;
}

std::size_t broker_config::get_heartbeat_multiplier() const
{
	return heartbeat_multiplier_;
}

bool broker_config::get_log_details() const
{
	return log_details_;
}

std::chrono::milliseconds broker_config::get_linger() const
{
	return linger_;
}

const log_config &broker_config::get_log_config() const
{
	return log_config_;
}

config_error::config_error(const std::string &msg) : std::runtime_error(msg)
{
}

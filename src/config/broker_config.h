#ifndef MDBROKER_CONFIG_H
#define MDBROKER_CONFIG_H

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>

#include "log_config.h"


/**
 * An object representation of the broker's configuration
 */
class broker_config
{
public:
	/** A default constructor */
	broker_config() = default;
	/**
	 * A constructor that loads the configuration from a YAML document.
	 * @param config The input document.
	 * @throws config_error if the document is malformed or contains invalid values
	 */
	broker_config(const YAML::Node &config);
	/**
	 * Destructor
	 */
	virtual ~broker_config() = default;
	/**
	 * Get the endpoint the broker socket binds to.
	 * @return ZeroMQ endpoint, e.g. tcp://\*:47047
	 */
	virtual const std::string &get_address() const;
	/**
	 * Get the maximal time spent in one poll, which is also the cadence of heartbeats and expiry sweeps.
	 * @return Poll timeout.
	 */
	virtual std::chrono::milliseconds get_poll_interval() const;
	/**
	 * Get the interval between two heartbeats sent to each live worker.
	 * @return Heartbeat interval.
	 */
	virtual std::chrono::seconds get_heartbeat_interval() const;
	/**
	 * Get the multiplier of the heartbeat interval which gives the worker time-to-live.
	 * @return Heartbeat multiplier.
	 */
	virtual std::size_t get_heartbeat_multiplier() const;
	/**
	 * Should every received message be logged?
	 * @return Verbose logging toggle.
	 */
	virtual bool get_log_details() const;
	/**
	 * Get the time the broker socket may keep unsent messages after it is closed.
	 * @return Socket linger period.
	 */
	virtual std::chrono::milliseconds get_linger() const;
	/**
	 * Get wrapper for logger configuration.
	 * @return Logging config as @ref log_config structure.
	 */
	const log_config &get_log_config() const;

private:
	/** Broker socket endpoint */
	std::string address_ = "tcp://*:47047";
	/** Poll timeout */
	std::chrono::milliseconds poll_interval_ = std::chrono::milliseconds(100);
	/** Interval between heartbeats */
	std::chrono::seconds heartbeat_interval_ = std::chrono::seconds(3);
	/** Heartbeat interval multiplier giving the worker TTL */
	std::size_t heartbeat_multiplier_ = 2;
	/** Verbose logging of received messages */
	bool log_details_ = false;
	/** Socket linger period */
	std::chrono::milliseconds linger_ = std::chrono::milliseconds(0);
	/** Configuration of logger */
	log_config log_config_;
};


/**
 * Broker configuration exception.
 */
class config_error : public std::runtime_error
{
public:
	/** Destructor */
	~config_error() override = default;

	/**
	 * Construction with message returned with @a what method.
	 * @param msg description of exception circumstances
	 */
	explicit config_error(const std::string &msg);
};

#endif // MDBROKER_CONFIG_H

#ifndef MDBROKER_BROKER_CORE_H
#define MDBROKER_BROKER_CORE_H

#include "spdlog/spdlog.h"
#include <functional>
#include <iostream>
#include <memory>
#include <vector>
#include <yaml-cpp/yaml.h>

#include <boost/program_options.hpp>


// Our very own code includes
#include "broker_connect.h"
#include "config/broker_config.h"
#include "config/log_config.h"


/**
 * The broker process: command line, configuration, logging, signals and the broker itself.
 * Any failure during start-up ends the process with exit code 1.
 */
class broker_core
{
public:
	broker_core() = delete;
	broker_core(const broker_core &source) = delete;
	broker_core &operator=(const broker_core &source) = delete;
	broker_core(const broker_core &&source) = delete;
	broker_core &operator=(const broker_core &&source) = delete;

	/**
	 * Parse the command line, load the configuration, set up logging and construct the broker.
	 * @param args command line arguments including the program name
	 */
	broker_core(std::vector<std::string> args);

	/**
	 * Stops forwarding signals to the broker.
	 */
	~broker_core();

	/**
	 * Bind the broker socket and serve until SIGINT or SIGTERM arrives.
	 */
	void run();

private:
	/**
	 * Create the file logger described by the configuration and write a start banner.
	 */
	void log_init();

	/**
	 * Create the worker registry, the ZeroMQ context and the broker.
	 */
	void broker_init();

	/**
	 * Make SIGINT and SIGTERM terminate the broker gracefully.
	 */
	void signals_init();

	/**
	 * Exit with code 1.
	 * @param msg reason, written to stderr and to the log (critical) when not empty
	 */
	[[noreturn]] void force_exit(const std::string &msg = "");

	/**
	 * Handle --help and --config.
	 */
	void parse_params();

	/**
	 * Load the YAML configuration file.
	 */
	void load_config();

	/** Command line arguments */
	std::vector<std::string> args_;

	/** Path of the configuration file */
	std::string config_filename_;

	/** Loaded configuration */
	std::shared_ptr<broker_config> config_;

	/** System logger */
	std::shared_ptr<spdlog::logger> logger_;

	/** Registry of live workers and services */
	std::shared_ptr<worker_registry> workers_;

	/** ZeroMQ context */
	std::shared_ptr<zmq::context_t> context_;

	/** The broker */
	std::shared_ptr<broker_connect> broker_;
};

#endif // MDBROKER_BROKER_CORE_H

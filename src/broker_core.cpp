#include "broker_core.h"

#include <atomic>
#include <csignal>
#include <cstdlib>

namespace
{
	/** The broker stopped by SIGINT and SIGTERM */
	std::atomic<broker_connect *> signal_target(nullptr);

	void terminate_on_signal(int)
	{
		auto target = signal_target.load();
		if (target != nullptr) {
			target->terminate();
		}
	}
}

broker_core::broker_core(std::vector<std::string> args)
	: args_(args), config_filename_("config.yml"), logger_(nullptr), broker_(nullptr)
{
	// parse cmd parameters
	parse_params();
	// load configuration from yaml file
	load_config();
	// initialize logger
	log_init();
	// construct and setup broker connection
	broker_init();
	// stop gracefully on Ctrl+C
	signals_init();
}

broker_core::~broker_core()
{
	signal_target.store(nullptr);
}

void broker_core::run()
{
	try {
		broker_->bind();
	} catch (zmq::error_t &e) {
		force_exit("Cannot bind broker to " + config_->get_address() + ": " + e.what());
	}

	logger_->info("Broker will now start brokering.");
	broker_->start_brokering();
	logger_->info("Broker will now end.");
}

void broker_core::parse_params()
{
	using namespace boost::program_options;

	// Declare the supported options.
	options_description desc("Allowed options for broker");
	desc.add_options()("help,h", "Writes this help message to stderr")(
		"config,c", value<std::string>(), "Set default configuration of this program");

	// The first argument is the program name
	std::vector<std::string> arguments;
	if (!args_.empty()) {
		arguments.assign(std::begin(args_) + 1, std::end(args_));
	}

	variables_map vm;
	try {
		store(command_line_parser(arguments).options(desc).run(), vm);
		notify(vm);
	} catch (std::exception &e) {
		force_exit("Error in loading a parameter: " + std::string(e.what()));
	}


	// Evaluate all information from command line
	if (vm.count("help")) {
		std::cerr << desc << std::endl;
		force_exit();
	}

	if (vm.count("config")) {
		config_filename_ = vm["config"].as<std::string>();
	}
}

void broker_core::load_config()
{
	try {
		YAML::Node config_yaml = YAML::LoadFile(config_filename_);
		config_ = std::make_shared<broker_config>(config_yaml);
	} catch (std::exception &e) {
		force_exit("Error loading config file: " + std::string(e.what()));
	}
}

void broker_core::force_exit(const std::string &msg)
{
	// write to log
	if (msg != "") {
		if (logger_ != nullptr) {
			logger_->critical(msg);
			logger_->flush();
		}
		std::cerr << msg << std::endl;
	}

	exit(1);
}

void broker_core::log_init()
{
	try {
		logger_ = helpers::create_file_logger(config_->get_log_config());
	} catch (std::exception &e) {
		force_exit("Logger: " + std::string(e.what()));
	}

	// Print header to log
	if (!logger_->should_log(spdlog::level::info)) {
		logger_->critical("--- Started MDP broker ---");
	} else {
		logger_->info("------------------------------");
		logger_->info("      Started MDP broker");
		logger_->info("------------------------------");
	}
}

void broker_core::broker_init()
{
	logger_->info("Initializing broker connection...");
	workers_ = std::make_shared<worker_registry>();
	context_ = std::make_shared<zmq::context_t>(1);
	broker_ = std::make_shared<broker_connect>(config_, context_, workers_, logger_);
	logger_->info("Broker connection initialized.");
}

void broker_core::signals_init()
{
	signal_target.store(broker_.get());
	std::signal(SIGINT, terminate_on_signal);
	std::signal(SIGTERM, terminate_on_signal);
}

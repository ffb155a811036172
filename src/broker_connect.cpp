#include "broker_connect.h"

const std::string broker_connect::KEY_BROKER = "broker";
const std::string broker_connect::KEY_INTERNAL_WORKERS = "internal_workers";
const std::string broker_connect::KEY_INTERNAL_REQUESTS = "internal_requests";
const std::string broker_connect::KEY_TIMER = "timer";
const std::string broker_connect::KEY_TERMINATE = "terminate";

broker_connect::broker_connect(std::shared_ptr<const broker_config> config,
	std::shared_ptr<zmq::context_t> context,
	std::shared_ptr<worker_registry> workers,
	std::shared_ptr<spdlog::logger> logger)
	: config_(config), logger_(logger), workers_(workers), reactor_(context, config->get_poll_interval(), logger)
{
	if (logger_ == nullptr) {
		logger_ = helpers::create_null_logger();
	}

	handler_ = std::make_shared<broker_handler>(config_, workers_, logger_);

	reactor_.add_socket(KEY_BROKER,
		std::make_shared<router_socket_wrapper>(context, config_->get_address(), true, config_->get_linger()));

	reactor_.add_handler({KEY_BROKER, KEY_INTERNAL_WORKERS, KEY_TIMER, KEY_TERMINATE}, handler_);
}

void broker_connect::add_internal_workers(std::shared_ptr<handler_interface> handler)
{
	// Timer messages let the pool announce itself and keep sending heartbeats
	reactor_.add_async_handler({KEY_INTERNAL_REQUESTS, KEY_TIMER}, handler);

	// Requests are routed through the reactor, which hands them to the asynchronous handler
	handler_->set_internal_delivery(
		[](const message_container &message, const handler_interface::response_cb &transport) { transport(message); });
}

void broker_connect::bind()
{
	logger_->debug("Binding broker to {}", config_->get_address());
	reactor_.initialize_sockets();
	logger_->info("Starting MDP 0.1 broker at {}", config_->get_address());
}

void broker_connect::start_brokering()
{
	reactor_.start_loop();
	logger_->info("The main loop terminated");
}

void broker_connect::terminate()
{
	reactor_.terminate();
}

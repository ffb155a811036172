#ifndef MDBROKER_BROKER_CONNECT_H
#define MDBROKER_BROKER_CONNECT_H


#include "config/broker_config.h"
#include "handlers/broker_handler.h"
#include "helpers/logger.h"
#include "reactor/reactor.h"
#include "reactor/router_socket_wrapper.h"
#include "worker_registry.h"
#include <chrono>
#include <memory>

/**
 * Receives requests from clients and forwards them to workers of the requested service.
 */
class broker_connect
{
private:
	/** Loaded broker configuration. */
	std::shared_ptr<const broker_config> config_;
	/** System logger. */
	std::shared_ptr<spdlog::logger> logger_;
	/** Registry of connected and alive workers. */
	std::shared_ptr<worker_registry> workers_;
	/** Handler implementing the protocol */
	std::shared_ptr<broker_handler> handler_;
	/** A reactor that provides us with an event-based API to communicate with the clients and workers */
	reactor reactor_;

public:
	/** A string key for the socket shared by clients and workers */
	const static std::string KEY_BROKER;

	/** A string key for messages sent by in-process workers to the broker */
	const static std::string KEY_INTERNAL_WORKERS;

	/** A string key for messages sent by the broker to in-process workers */
	const static std::string KEY_INTERNAL_REQUESTS;

	/** A string key for messages about time elapsed in the poll loop */
	const static std::string KEY_TIMER;

	/** A string key for the message announcing the end of the poll loop */
	const static std::string KEY_TERMINATE;

	/**
	 * @param config a configuration object used to set up the connections
	 * @param context ZeroMQ context
	 * @param workers A registry used to track workers and their services
	 * @param logger
	 */
	broker_connect(std::shared_ptr<const broker_config> config,
		std::shared_ptr<zmq::context_t> context,
		std::shared_ptr<worker_registry> workers,
		std::shared_ptr<spdlog::logger> logger = nullptr);

	/**
	 * Attach a handler serving in-process workers. It runs in its own thread, receives messages keyed
	 * @ref KEY_INTERNAL_REQUESTS and @ref KEY_TIMER and talks back to the broker with protocol messages keyed
	 * @ref KEY_INTERNAL_WORKERS.
	 * Must be called before @ref start_brokering.
	 * @param handler the in-process worker pool
	 */
	void add_internal_workers(std::shared_ptr<handler_interface> handler);

	/**
	 * Bind the broker socket.
	 * @throws zmq::error_t if the address cannot be bound
	 */
	void bind();

	/**
	 * Start receiving and routing requests (binding first if @ref bind was not called).
	 * Blocks execution until @ref terminate is called.
	 */
	void start_brokering();

	/**
	 * Ask the broker to disconnect its workers and stop. Async-signal-safe.
	 */
	void terminate();
};


#endif // MDBROKER_BROKER_CONNECT_H

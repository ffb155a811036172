#ifndef MDBROKER_BROKER_HANDLER_H
#define MDBROKER_BROKER_HANDLER_H

#include <functional>
#include <memory>
#include <mutex>
#include <spdlog/logger.h>

#include "../config/broker_config.h"
#include "../delivery_selector.h"
#include "../liveness_monitor.h"
#include "../mdp/codec.h"
#include "../queuing/service_dispatcher.h"
#include "../reactor/handler_interface.h"
#include "../worker_registry.h"

/**
 * Processes requests from workers and clients and forwards them accordingly.
 *
 * Subscribed to the broker socket, to messages of in-process workers, to the reactor timer (heartbeats and expiry)
 * and to the reactor termination (disconnecting all workers). Every message is processed as a whole under a single
 * coordination lock.
 */
class broker_handler : public handler_interface
{
public:
	/** Source of the current time */
	typedef std::function<broker_clock::time_point()> clock_fn;

	/**
	 * @param config broker configuration
	 * @param workers worker registry (it's acceptable if it already contains some workers)
	 * @param logger an optional logger
	 * @param clock an optional source of time, the steady clock is used by default
	 */
	broker_handler(std::shared_ptr<const broker_config> config,
		std::shared_ptr<worker_registry> workers,
		std::shared_ptr<spdlog::logger> logger,
		clock_fn clock = nullptr);

	void on_request(const message_container &message, const response_cb &respond) override;

	/**
	 * Supply the function which delivers messages to in-process workers.
	 * @param fn the delivery function
	 */
	void set_internal_delivery(delivery_selector::delivery_fn fn);

private:
	/** Broker configuration */
	std::shared_ptr<const broker_config> config_;

	/** Worker registry used for keeping track of workers and services */
	std::shared_ptr<worker_registry> workers_;

	/** Matches requests with workers */
	service_dispatcher dispatcher_;

	/** Expiry and heartbeats */
	liveness_monitor monitor_;

	/** The way messages reach workers of each class */
	delivery_selector delivery_;

	/** A system logger */
	std::shared_ptr<spdlog::logger> logger_;

	/** Source of time */
	clock_fn clock_;

	/** The coordination lock, recursive so that a delivery function may call back into the handler */
	std::recursive_mutex mutex_;

	/**
	 * Process a message from the broker socket or from an in-process worker.
	 */
	void process_message(worker_class origin, const message_container &message, const response_cb &respond);

	/**
	 * Queue a client request and hand it to a worker if one is available.
	 */
	void process_client_request(const mdp::event &event, broker_clock::time_point now, const response_cb &respond);

	/**
	 * A worker is ready to serve a service. Register it and give it a queued request, if any.
	 */
	void process_worker_ready(
		worker_class type, const mdp::event &event, broker_clock::time_point now, const response_cb &respond);

	/**
	 * Forward a reply of a worker to the client.
	 */
	void process_worker_reply(worker_class type, const mdp::event &event, const response_cb &respond);

	/**
	 * Extend the life of a worker.
	 */
	void process_worker_heartbeat(worker_class type, const mdp::event &event, broker_clock::time_point now);

	/**
	 * Forget a worker which announced its departure.
	 */
	void process_worker_disconnect(worker_class type, const mdp::event &event);

	/**
	 * Process a message about elapsed time from the reactor.
	 * Expired workers are removed and heartbeats are sent to the workers which are due one.
	 */
	void process_timer(const response_cb &respond);

	/**
	 * Remove expired workers and log them.
	 */
	void sweep_expired_workers(broker_clock::time_point now);

	/**
	 * The reactor is terminating. Tell all live workers that the broker is going away.
	 */
	void process_shutdown(const response_cb &respond);

	/**
	 * Send assigned requests to their workers. A request which cannot be delivered goes back to its queue.
	 */
	void send_assignments(const std::vector<assignment> &assignments, const response_cb &respond);

	/**
	 * Deliver a message to a worker of given class.
	 * @return false if the message could not be delivered (the failure is logged)
	 */
	bool send_to_worker(worker_class type, const message_container &message, const response_cb &respond);

	/**
	 * Key of messages destined to workers of given class.
	 */
	static const std::string &worker_key(worker_class type);
};

#endif // MDBROKER_BROKER_HANDLER_H

#ifndef MDBROKER_SERVICE_DISPATCHER_H
#define MDBROKER_SERVICE_DISPATCHER_H

#include <memory>
#include <string>
#include <vector>

#include "../worker_registry.h"

/**
 * A request matched with a worker. The caller must deliver it to the worker.
 */
struct assignment {
	/** The worker, already removed from the registry */
	worker_registry::worker_ptr assigned_to;

	/** Name of the service of the request */
	std::string service_name;

	/** The request */
	client_request request;
};

/**
 * Pairs pending requests with available workers of the same service, oldest with oldest.
 * A worker given a request leaves the registry and has to send another READY to get more work.
 */
class service_dispatcher
{
public:
	/**
	 * @param workers registry holding the services and their queues
	 */
	explicit service_dispatcher(std::shared_ptr<worker_registry> workers);

	/**
	 * Append a request to the queue of its service (created if needed) and dispatch the service.
	 * @param service_name name of the requested service
	 * @param request the request
	 * @param now current time
	 * @return requests which were assigned to workers, in order of receipt
	 */
	std::vector<assignment> submit_request(
		const std::string &service_name, const client_request &request, broker_clock::time_point now);

	/**
	 * Sweep expired workers, then match pending requests of a service with its available workers until one of
	 * the queues runs dry.
	 * @param service_name name of the service
	 * @param now current time
	 * @return requests which were assigned to workers, in order of receipt
	 */
	std::vector<assignment> dispatch(const std::string &service_name, broker_clock::time_point now);

	/**
	 * Return a request whose delivery failed to the head of its queue.
	 * @param failed the undelivered assignment
	 */
	void requeue(const assignment &failed);

	/**
	 * Get the total amount of queued requests
	 */
	std::size_t get_queued_request_count() const;

private:
	/** Registry of workers and services */
	std::shared_ptr<worker_registry> workers_;
};

#endif // MDBROKER_SERVICE_DISPATCHER_H

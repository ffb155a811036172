#ifndef MDBROKER_SERVICE_H
#define MDBROKER_SERVICE_H

#include <deque>
#include <string>
#include <vector>

#include "worker.h"


/**
 * A request received from a client, waiting for a worker of its service.
 */
struct client_request {
	/** Transport address of the requesting client. */
	std::string client_identity;

	/** Opaque body frames, forwarded to the worker untouched. */
	std::vector<std::string> body;

	/** Time the broker received the request. */
	broker_clock::time_point received_at;

	/** Default constructor */
	client_request() = default;

	/**
	 * @param client_identity transport address of the client
	 * @param body body frames
	 * @param received_at time of receipt
	 */
	client_request(
		const std::string &client_identity, const std::vector<std::string> &body, broker_clock::time_point received_at);
};

/**
 * Pending requests and available workers of one named service.
 * Workers are referenced by their wrapped identity only, the records themselves live in the registry.
 */
class service
{
public:
	/** Name of the service. */
	const std::string name;

	/** Requests in order of receipt. */
	std::deque<client_request> requests;

	/** Identities of available workers in order of their READY. */
	std::deque<std::string> workers;

	/**
	 * @param name name of the service
	 */
	explicit service(const std::string &name);

	/**
	 * Remove a worker identity from the queue of available workers.
	 * @param identity wrapped worker identity
	 * @return true if the identity was queued
	 */
	bool remove_worker(const std::string &identity);

	/**
	 * @return true if the service has neither pending requests nor available workers
	 */
	bool is_idle() const;
};

#endif // MDBROKER_SERVICE_H

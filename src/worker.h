#ifndef MDBROKER_WORKER_H
#define MDBROKER_WORKER_H

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>


/** Monotonic clock used for every liveness computation in the broker. */
typedef std::chrono::steady_clock broker_clock;

/**
 * The way a worker is reached by the broker.
 */
enum class worker_class {
	/** Remote worker connected to the broker socket. */
	zmq,
	/** In-process worker served by a delivery function supplied by the host. */
	internal
};

/**
 * Reversible encoding of a worker class and a raw transport address into one registry key, so that raw
 * addresses of different worker classes never collide.
 */
namespace worker_identity
{
	/** Separates the class tag from the raw address in a wrapped identity. */
	const char separator = ':';

	/**
	 * Get the textual tag of a worker class (never contains @ref separator).
	 * @param type worker class
	 * @return class tag
	 */
	std::string class_tag(worker_class type);

	/**
	 * Combine worker class and raw transport address into a registry key.
	 * @param type worker class
	 * @param raw raw transport address
	 * @return wrapped identity
	 */
	std::string wrap(worker_class type, const std::string &raw);

	/**
	 * Split a wrapped identity back into the worker class and the raw transport address.
	 * @param wrapped identity created by @ref wrap
	 * @return pair of worker class and raw address
	 * @throws std::invalid_argument if the identity was not created by @ref wrap
	 */
	std::pair<worker_class, std::string> unwrap(const std::string &wrapped);
}

/**
 * Liveness record of a worker which declared itself ready to serve a service.
 */
class worker
{
public:
	/** Wrapped identity, the key of the worker in the registry. */
	const std::string identity;

	/** The way the worker is reached. */
	const worker_class type;

	/** Raw transport address (e.g. ZeroMQ routing id). */
	const std::string raw_identity;

	/** Name of the service the worker declared in its last READY. */
	std::string service_name;

	/** Time of the READY which created this record. */
	broker_clock::time_point registered_at;

	/** Time of the last heartbeat sent by the broker, meaningful only if @ref heartbeat_sent is set. */
	broker_clock::time_point last_heartbeat_sent;

	/** Whether the broker has sent any heartbeat to this worker yet. */
	bool heartbeat_sent = false;

	/** Time of the last heartbeat received from the worker (registration counts as one). */
	broker_clock::time_point last_heartbeat_received;

	/** The worker is considered dead from this moment on. */
	broker_clock::time_point expires_at;

	/**
	 * @param type worker class
	 * @param raw_identity raw transport address
	 * @param service_name declared service
	 * @param now time of registration
	 * @param ttl time the worker may stay silent before it is presumed dead
	 */
	worker(worker_class type,
		const std::string &raw_identity,
		const std::string &service_name,
		broker_clock::time_point now,
		broker_clock::duration ttl);

	/**
	 * Record a heartbeat from the worker and extend its expiry.
	 * @param now time of the heartbeat
	 * @param ttl liveness time-to-live
	 */
	void refresh(broker_clock::time_point now, broker_clock::duration ttl);

	/**
	 * @param now current time
	 * @return true if the worker is dead at given time
	 */
	bool is_expired(broker_clock::time_point now) const;

	/**
	 * Check whether the broker should send a heartbeat to the worker.
	 * @param now current time
	 * @param interval heartbeat interval
	 * @return true if no heartbeat was sent yet or the last one is at least @a interval old
	 */
	bool heartbeat_due(broker_clock::time_point now, broker_clock::duration interval) const;

	/**
	 * Get a textual description of the worker
	 * @return class tag, hex encoded raw address and the service name
	 */
	std::string get_description() const;
};

#endif // MDBROKER_WORKER_H

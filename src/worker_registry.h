#ifndef MDBROKER_WORKER_REGISTRY_H
#define MDBROKER_WORKER_REGISTRY_H

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "service.h"
#include "worker.h"

/**
 * Owns the records of all live workers and, per service name, its pending requests and available workers.
 * Services refer to workers by wrapped identity only; a worker removed from the registry disappears from
 * every service queue in the same call.
 * The registry does no locking on its own, the caller holds the coordination lock.
 */
class worker_registry
{
public:
	/** Pointer to worker instance type. */
	typedef std::shared_ptr<worker> worker_ptr;

private:
	/** Live workers indexed by wrapped identity. */
	std::map<std::string, worker_ptr> workers_;

	/** Services indexed by name. */
	std::map<std::string, service> services_;

	/**
	 * A request handed to a worker which did not answer yet.
	 */
	struct pending_reply {
		/** Service of the request */
		std::string service_name;

		/** The worker is presumed dead from this moment on */
		broker_clock::time_point expires_at;
	};

	/** Pending replies indexed by wrapped identity of the busy worker. */
	std::map<std::string, pending_reply> assignments_;

	/**
	 * Drop a worker identity from every service queue.
	 * @param identity wrapped worker identity
	 */
	void purge_from_services(const std::string &identity);

public:
	/** Default constructor, initializes empty registry. */
	worker_registry();

	/** Destructor */
	virtual ~worker_registry() = default;

	/**
	 * Create (or overwrite) the record of a worker that declared itself ready and append it to the available
	 * workers of its service. A worker already queued elsewhere is moved.
	 * @param type worker class
	 * @param raw_identity raw transport address
	 * @param service_name declared service
	 * @param now current time
	 * @param ttl liveness time-to-live
	 * @return the new record
	 */
	virtual worker_ptr register_ready(worker_class type,
		const std::string &raw_identity,
		const std::string &service_name,
		broker_clock::time_point now,
		broker_clock::duration ttl);

	/**
	 * Refresh the liveness of a known worker. A worker which already expired is removed instead.
	 * @param identity wrapped worker identity
	 * @param now current time
	 * @param ttl liveness time-to-live
	 * @return @a false if no such live worker is registered
	 */
	virtual bool record_heartbeat(const std::string &identity, broker_clock::time_point now, broker_clock::duration ttl);

	/**
	 * Remove worker from registry and from every service queue.
	 * @param identity wrapped worker identity
	 * @return @a false if no such worker is registered
	 */
	virtual bool remove_worker(const std::string &identity);

	/**
	 * Remove every worker which expired at given time, forget assignments of busy workers which expired and
	 * services with nothing queued.
	 * @param now current time
	 * @return removed workers
	 */
	virtual std::vector<worker_ptr> sweep_expired(broker_clock::time_point now);

	/**
	 * Find worker by it's unique identifier.
	 * @param identity wrapped identity of worker we want to get instance.
	 * @return Instance of worker with given ID or @a nullptr.
	 */
	virtual worker_ptr find_worker_by_identity(const std::string &identity) const;

	/**
	 * Get all workers known to this registry.
	 * @return Collection of all known workers.
	 */
	virtual std::vector<worker_ptr> get_workers() const;

	/**
	 * Get a service, creating it if it is not known yet.
	 * @param name name of the service
	 * @return reference valid until the service is collected by @ref sweep_expired
	 */
	service &get_service(const std::string &name);

	/**
	 * Find a service by name.
	 * @param name name of the service
	 * @return pointer to the service or @a nullptr
	 */
	service *find_service(const std::string &name);

	/**
	 * Get all known services.
	 */
	const std::map<std::string, service> &get_services() const;

	/**
	 * Remember that a worker was given a request of a service.
	 * @param identity wrapped worker identity
	 * @param service_name name of the service
	 * @param expires_at the assignment is dropped by @ref sweep_expired from this moment on
	 */
	void begin_assignment(
		const std::string &identity, const std::string &service_name, broker_clock::time_point expires_at);

	/**
	 * Postpone the expiry of an assignment, a busy worker keeps sending heartbeats.
	 * @param identity wrapped worker identity
	 * @param expires_at new expiry
	 * @return @a false if the worker has no assignment
	 */
	bool refresh_assignment(const std::string &identity, broker_clock::time_point expires_at);

	/**
	 * Forget the assignment of a worker.
	 * @param identity wrapped worker identity
	 * @param service_name set to the service of the assignment, if there was one
	 * @return @a false if the worker had no assignment
	 */
	bool end_assignment(const std::string &identity, std::string &service_name);

	/**
	 * Get the number of workers which were dispatched a request and did not answer yet.
	 */
	std::size_t get_assignment_count() const;
};

#endif // MDBROKER_WORKER_REGISTRY_H

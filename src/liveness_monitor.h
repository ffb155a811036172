#ifndef MDBROKER_LIVENESS_MONITOR_H
#define MDBROKER_LIVENESS_MONITOR_H

#include <chrono>
#include <memory>
#include <vector>

#include "worker_registry.h"

/**
 * Evicts workers which stopped sending heartbeats and decides which live workers should get a heartbeat from
 * the broker. Every operation sweeps expired workers first.
 */
class liveness_monitor
{
public:
	typedef worker_registry::worker_ptr worker_ptr;

	/**
	 * @param workers registry of the workers to watch
	 * @param heartbeat_interval time between two heartbeats sent to one worker
	 * @param heartbeat_multiplier how many heartbeat intervals a worker may stay silent
	 */
	liveness_monitor(std::shared_ptr<worker_registry> workers,
		std::chrono::seconds heartbeat_interval,
		std::size_t heartbeat_multiplier);

	/**
	 * Get the time a worker may stay silent before it's considered dead.
	 */
	broker_clock::duration get_ttl() const;

	/**
	 * Get the time between two heartbeats sent to one worker.
	 */
	broker_clock::duration get_heartbeat_interval() const;

	/**
	 * Remove expired workers from the registry.
	 * @param now current time
	 * @return removed workers
	 */
	std::vector<worker_ptr> sweep(broker_clock::time_point now);

	/**
	 * Sweep, then pick live workers which are due a heartbeat and mark it as sent.
	 * The caller is expected to actually send the heartbeats.
	 * @param now current time
	 * @return workers which should receive a heartbeat
	 */
	std::vector<worker_ptr> collect_heartbeats(broker_clock::time_point now);

	/**
	 * Sweep, then remove all remaining workers from the registry.
	 * @param now current time
	 * @return live workers which should be told the broker is going away
	 */
	std::vector<worker_ptr> collect_for_shutdown(broker_clock::time_point now);

private:
	/** Watched registry */
	std::shared_ptr<worker_registry> workers_;

	/** Time between two heartbeats */
	broker_clock::duration heartbeat_interval_;

	/** Liveness time-to-live */
	broker_clock::duration ttl_;
};

#endif // MDBROKER_LIVENESS_MONITOR_H

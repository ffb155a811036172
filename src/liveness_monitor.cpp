#include "liveness_monitor.h"


liveness_monitor::liveness_monitor(
	std::shared_ptr<worker_registry> workers, std::chrono::seconds heartbeat_interval, std::size_t heartbeat_multiplier)
	: workers_(workers), heartbeat_interval_(heartbeat_interval), ttl_(heartbeat_interval * heartbeat_multiplier)
{
}

broker_clock::duration liveness_monitor::get_ttl() const
{
	return ttl_;
}

broker_clock::duration liveness_monitor::get_heartbeat_interval() const
{
	return heartbeat_interval_;
}

std::vector<liveness_monitor::worker_ptr> liveness_monitor::sweep(broker_clock::time_point now)
{
	return workers_->sweep_expired(now);
}

std::vector<liveness_monitor::worker_ptr> liveness_monitor::collect_heartbeats(broker_clock::time_point now)
{
	sweep(now);

	std::vector<worker_ptr> due;

	for (auto &worker : workers_->get_workers()) {
		if (worker->heartbeat_due(now, heartbeat_interval_)) {
			worker->last_heartbeat_sent = now;
			worker->heartbeat_sent = true;
			due.push_back(worker);
		}
	}

	return due;
}

std::vector<liveness_monitor::worker_ptr> liveness_monitor::collect_for_shutdown(broker_clock::time_point now)
{
	sweep(now);

	auto remaining = workers_->get_workers();

	for (auto &worker : remaining) {
		workers_->remove_worker(worker->identity);
	}

	return remaining;
}

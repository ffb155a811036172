#include "service_dispatcher.h"


service_dispatcher::service_dispatcher(std::shared_ptr<worker_registry> workers) : workers_(workers)
{
}

std::vector<assignment> service_dispatcher::submit_request(
	const std::string &service_name, const client_request &request, broker_clock::time_point now)
{
	workers_->get_service(service_name).requests.push_back(request);
	return dispatch(service_name, now);
}

std::vector<assignment> service_dispatcher::dispatch(const std::string &service_name, broker_clock::time_point now)
{
	std::vector<assignment> result;

	// Expired workers must never be given a request
	workers_->sweep_expired(now);

	service *target = workers_->find_service(service_name);
	if (target == nullptr) {
		return result;
	}

	while (!target->requests.empty() && !target->workers.empty()) {
		auto identity = target->workers.front();
		auto worker = workers_->find_worker_by_identity(identity);

		if (worker == nullptr) {
			// Queues only hold registered identities, so this is a stale entry
			target->workers.pop_front();
			continue;
		}

		assignment item;
		item.assigned_to = worker;
		item.service_name = service_name;
		item.request = target->requests.front();
		target->requests.pop_front();

		// A busy worker is simply not registered until its next READY, the assignment lives as long as
		// the worker would without a heartbeat
		workers_->remove_worker(identity);
		workers_->begin_assignment(identity, service_name, now + (worker->expires_at - worker->last_heartbeat_received));

		result.push_back(item);
	}

	return result;
}

void service_dispatcher::requeue(const assignment &failed)
{
	std::string ignored;
	workers_->end_assignment(failed.assigned_to->identity, ignored);
	workers_->get_service(failed.service_name).requests.push_front(failed.request);
}

std::size_t service_dispatcher::get_queued_request_count() const
{
	std::size_t count = 0;

	for (auto &item : workers_->get_services()) {
		count += item.second.requests.size();
	}

	return count;
}

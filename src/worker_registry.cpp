#include "worker_registry.h"


worker_registry::worker_registry()
{
}

void worker_registry::purge_from_services(const std::string &identity)
{
	for (auto &item : services_) {
		item.second.remove_worker(identity);
	}
}

worker_registry::worker_ptr worker_registry::register_ready(worker_class type,
	const std::string &raw_identity,
	const std::string &service_name,
	broker_clock::time_point now,
	broker_clock::duration ttl)
{
	auto record = std::make_shared<worker>(type, raw_identity, service_name, now, ttl);

	// A repeated READY must not leave the identity queued twice
	purge_from_services(record->identity);

	workers_[record->identity] = record;
	get_service(service_name).workers.push_back(record->identity);

	return record;
}

bool worker_registry::record_heartbeat(
	const std::string &identity, broker_clock::time_point now, broker_clock::duration ttl)
{
	auto it = workers_.find(identity);

	if (it == std::end(workers_)) {
		return false;
	}

	// Dead workers come back only through a new READY
	if (it->second->is_expired(now)) {
		workers_.erase(it);
		purge_from_services(identity);
		return false;
	}

	it->second->refresh(now, ttl);
	return true;
}

bool worker_registry::remove_worker(const std::string &identity)
{
	auto it = workers_.find(identity);

	if (it == std::end(workers_)) {
		return false;
	}

	workers_.erase(it);
	purge_from_services(identity);
	return true;
}

std::vector<worker_registry::worker_ptr> worker_registry::sweep_expired(broker_clock::time_point now)
{
	std::vector<worker_ptr> expired;

	for (auto it = std::begin(workers_); it != std::end(workers_);) {
		if (it->second->is_expired(now)) {
			expired.push_back(it->second);
			purge_from_services(it->first);
			it = workers_.erase(it);
		} else {
			++it;
		}
	}

	for (auto it = std::begin(assignments_); it != std::end(assignments_);) {
		if (it->second.expires_at <= now) {
			it = assignments_.erase(it);
		} else {
			++it;
		}
	}

	for (auto it = std::begin(services_); it != std::end(services_);) {
		if (it->second.is_idle()) {
			it = services_.erase(it);
		} else {
			++it;
		}
	}

	return expired;
}

worker_registry::worker_ptr worker_registry::find_worker_by_identity(const std::string &identity) const
{
	auto it = workers_.find(identity);

	if (it == std::end(workers_)) {
		return nullptr;
	}

	return it->second;
}

std::vector<worker_registry::worker_ptr> worker_registry::get_workers() const
{
	std::vector<worker_ptr> result;
	result.reserve(workers_.size());

	for (auto &item : workers_) {
		result.push_back(item.second);
	}

	return result;
}

service &worker_registry::get_service(const std::string &name)
{
	auto it = services_.find(name);

	if (it == std::end(services_)) {
		it = services_.emplace(name, service(name)).first;
	}

	return it->second;
}

service *worker_registry::find_service(const std::string &name)
{
	auto it = services_.find(name);

	if (it == std::end(services_)) {
		return nullptr;
	}

	return &it->second;
}

const std::map<std::string, service> &worker_registry::get_services() const
{
	return services_;
}

void worker_registry::begin_assignment(
	const std::string &identity, const std::string &service_name, broker_clock::time_point expires_at)
{
	assignments_[identity] = pending_reply{service_name, expires_at};
}

bool worker_registry::refresh_assignment(const std::string &identity, broker_clock::time_point expires_at)
{
	auto it = assignments_.find(identity);

	if (it == std::end(assignments_)) {
		return false;
	}

	it->second.expires_at = expires_at;
	return true;
}

bool worker_registry::end_assignment(const std::string &identity, std::string &service_name)
{
	auto it = assignments_.find(identity);

	if (it == std::end(assignments_)) {
		return false;
	}

	service_name = it->second.service_name;
	assignments_.erase(it);
	return true;
}

std::size_t worker_registry::get_assignment_count() const
{
	return assignments_.size();
}

#include "worker.h"
#include "helpers/string_to_hex.h"

std::string worker_identity::class_tag(worker_class type)
{
	switch (type) {
	case worker_class::zmq: return "zmq";
	case worker_class::internal: return "internal";
	}

	throw std::invalid_argument("Unknown worker class");
}

std::string worker_identity::wrap(worker_class type, const std::string &raw)
{
	return class_tag(type) + separator + raw;
}

std::pair<worker_class, std::string> worker_identity::unwrap(const std::string &wrapped)
{
	auto pos = wrapped.find(separator);

	if (pos == std::string::npos) {
		throw std::invalid_argument("Worker identity is not wrapped");
	}

	auto tag = wrapped.substr(0, pos);
	auto raw = wrapped.substr(pos + 1);

	if (tag == class_tag(worker_class::zmq)) {
		return std::make_pair(worker_class::zmq, raw);
	} else if (tag == class_tag(worker_class::internal)) {
		return std::make_pair(worker_class::internal, raw);
	}

	throw std::invalid_argument("Unknown worker class tag '" + tag + "'");
}


worker::worker(worker_class type,
	const std::string &raw_identity,
	const std::string &service_name,
	broker_clock::time_point now,
	broker_clock::duration ttl)
	: identity(worker_identity::wrap(type, raw_identity)), type(type), raw_identity(raw_identity),
	  service_name(service_name), registered_at(now), last_heartbeat_received(now), expires_at(now + ttl)
{
}

void worker::refresh(broker_clock::time_point now, broker_clock::duration ttl)
{
	last_heartbeat_received = now;
	expires_at = now + ttl;
}

bool worker::is_expired(broker_clock::time_point now) const
{
	return expires_at <= now;
}

bool worker::heartbeat_due(broker_clock::time_point now, broker_clock::duration interval) const
{
	return !heartbeat_sent || now >= last_heartbeat_sent + interval;
}

std::string worker::get_description() const
{
	return worker_identity::class_tag(type) + worker_identity::separator + helpers::string_to_hex(raw_identity) +
		" (" + service_name + ")";
}

#include "broker_handler.h"
#include "../broker_connect.h"
#include "../helpers/logger.h"
#include "../helpers/string_to_hex.h"

broker_handler::broker_handler(std::shared_ptr<const broker_config> config,
	std::shared_ptr<worker_registry> workers,
	std::shared_ptr<spdlog::logger> logger,
	clock_fn clock)
	: config_(config), workers_(workers), dispatcher_(workers),
	  monitor_(workers, config->get_heartbeat_interval(), config->get_heartbeat_multiplier()), logger_(logger),
	  clock_(clock)
{
	if (logger_ == nullptr) {
		logger_ = helpers::create_null_logger();
	}

	if (!clock_) {
		clock_ = []() { return broker_clock::now(); };
	}
}

void broker_handler::set_internal_delivery(delivery_selector::delivery_fn fn)
{
	std::lock_guard<std::recursive_mutex> lock(mutex_);
	delivery_.set_delivery(worker_class::internal, fn);
}

void broker_handler::on_request(const message_container &message, const response_cb &respond)
{
	std::lock_guard<std::recursive_mutex> lock(mutex_);

	if (message.key == broker_connect::KEY_BROKER) {
		process_message(worker_class::zmq, message, respond);
	} else if (message.key == broker_connect::KEY_INTERNAL_WORKERS) {
		process_message(worker_class::internal, message, respond);
	} else if (message.key == broker_connect::KEY_TIMER) {
		process_timer(respond);
	} else if (message.key == broker_connect::KEY_TERMINATE) {
		process_shutdown(respond);
	}
}

void broker_handler::process_message(worker_class origin, const message_container &message, const response_cb &respond)
{
	if (config_->get_log_details()) {
		logger_->info("Received message {}", message.to_string());
	}

	mdp::event event;

	try {
		event = mdp::decode(message);
	} catch (mdp::unknown_command_error &e) {
		logger_->warn("Dropped message from {}: {}", helpers::string_to_hex(message.identity), e.what());
		return;
	} catch (mdp::protocol_error &e) {
		logger_->error("Malformed message from {}: {}", helpers::string_to_hex(message.identity), e.what());
		return;
	}

	// Timer ticks come after the messages of a poll cycle, dead workers must not be served in between
	auto now = clock_();
	sweep_expired_workers(now);

	switch (event.type) {
	case mdp::event_type::client_request:
		if (origin != worker_class::zmq) {
			logger_->error("Client request from an in-process worker ignored");
			return;
		}
		process_client_request(event, now, respond);
		break;
	case mdp::event_type::worker_ready: process_worker_ready(origin, event, now, respond); break;
	case mdp::event_type::worker_reply: process_worker_reply(origin, event, respond); break;
	case mdp::event_type::worker_heartbeat: process_worker_heartbeat(origin, event, now); break;
	case mdp::event_type::worker_disconnect: process_worker_disconnect(origin, event); break;
	}
}

void broker_handler::process_client_request(
	const mdp::event &event, broker_clock::time_point now, const response_cb &respond)
{
	logger_->debug("Request for service '{}' from client {}", event.service_name, helpers::string_to_hex(event.sender));

	auto assignments =
		dispatcher_.submit_request(event.service_name, client_request(event.sender, event.body, now), now);

	if (assignments.empty()) {
		logger_->debug(" - saved to queue, {} requests waiting", dispatcher_.get_queued_request_count());
	}

	send_assignments(assignments, respond);
}

void broker_handler::process_worker_ready(
	worker_class type, const mdp::event &event, broker_clock::time_point now, const response_cb &respond)
{
	auto identity = worker_identity::wrap(type, event.sender);

	// A READY after a request means the worker is done with it
	std::string previous_service;
	workers_->end_assignment(identity, previous_service);

	auto record = workers_->register_ready(type, event.sender, event.service_name, now, monitor_.get_ttl());
	logger_->info("Added worker {}", record->get_description());

	send_assignments(dispatcher_.dispatch(event.service_name, now), respond);
}

void broker_handler::process_worker_reply(worker_class type, const mdp::event &event, const response_cb &respond)
{
	auto identity = worker_identity::wrap(type, event.sender);
	std::string service_name;

	if (!workers_->end_assignment(identity, service_name)) {
		logger_->warn("Reply from worker {} which was not given any request", helpers::string_to_hex(event.sender));
	}

	respond(mdp::encode_reply(broker_connect::KEY_BROKER, event.client, service_name, event.body));
	logger_->debug(" - reply for client {} forwarded", helpers::string_to_hex(event.client));
}

void broker_handler::process_worker_heartbeat(worker_class type, const mdp::event &event, broker_clock::time_point now)
{
	auto identity = worker_identity::wrap(type, event.sender);

	if (workers_->record_heartbeat(identity, now, monitor_.get_ttl())) {
		return;
	}

	// Busy workers are not registered, their heartbeats keep the assignment alive
	if (!workers_->refresh_assignment(identity, now + monitor_.get_ttl())) {
		logger_->warn("No worker found for heartbeat from {}", helpers::string_to_hex(event.sender));
	}
}

void broker_handler::process_worker_disconnect(worker_class type, const mdp::event &event)
{
	auto identity = worker_identity::wrap(type, event.sender);

	std::string service_name;
	workers_->end_assignment(identity, service_name);

	if (workers_->remove_worker(identity)) {
		logger_->info("Worker {} disconnected", helpers::string_to_hex(event.sender));
	} else {
		logger_->warn("Disconnect from unknown worker {}", helpers::string_to_hex(event.sender));
	}
}

void broker_handler::process_timer(const response_cb &respond)
{
	auto now = clock_();
	sweep_expired_workers(now);

	for (auto &worker : monitor_.collect_heartbeats(now)) {
		send_to_worker(
			worker->type, mdp::encode_heartbeat(worker_key(worker->type), worker->raw_identity), respond);
	}
}

void broker_handler::sweep_expired_workers(broker_clock::time_point now)
{
	for (auto &worker : monitor_.sweep(now)) {
		logger_->info("Worker {} expired", worker->get_description());
	}
}

void broker_handler::process_shutdown(const response_cb &respond)
{
	auto workers = monitor_.collect_for_shutdown(clock_());
	logger_->info("Broker is shutting down, disconnecting {} workers", workers.size());

	for (auto &worker : workers) {
		send_to_worker(
			worker->type, mdp::encode_disconnect(worker_key(worker->type), worker->raw_identity), respond);
	}
}

void broker_handler::send_assignments(const std::vector<assignment> &assignments, const response_cb &respond)
{
	for (auto &item : assignments) {
		auto &worker = item.assigned_to;
		auto message = mdp::encode_request(
			worker_key(worker->type), worker->raw_identity, item.request.client_identity, item.request.body);

		if (send_to_worker(worker->type, message, respond)) {
			logger_->debug(" - request of service '{}' sent to worker {}", item.service_name, worker->get_description());
		} else {
			dispatcher_.requeue(item);
		}
	}
}

bool broker_handler::send_to_worker(worker_class type, const message_container &message, const response_cb &respond)
{
	try {
		delivery_.deliver(type, message, respond);
	} catch (delivery_error &e) {
		logger_->error("Cannot deliver a message to worker {}: {}", helpers::string_to_hex(message.identity), e.what());
		return false;
	}

	return true;
}

const std::string &broker_handler::worker_key(worker_class type)
{
	return type == worker_class::zmq ? broker_connect::KEY_BROKER : broker_connect::KEY_INTERNAL_REQUESTS;
}

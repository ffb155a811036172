#include "codec.h"
#include "../helpers/string_to_hex.h"

mdp::protocol_error::protocol_error(const std::string &msg) : std::runtime_error(msg)
{
}

mdp::unknown_command_error::unknown_command_error(const std::string &msg) : protocol_error(msg)
{
}

namespace
{
	void decode_client(const std::vector<std::string> &frames, mdp::event &result)
	{
		if (frames.size() < 3) {
			throw mdp::protocol_error("Client message without service name");
		}

		result.type = mdp::event_type::client_request;
		result.service_name = frames.at(2);
		result.body.assign(std::begin(frames) + 3, std::end(frames));
	}

	void decode_worker(const std::vector<std::string> &frames, mdp::event &result)
	{
		if (frames.size() < 3) {
			throw mdp::protocol_error("Worker message without command");
		}

		auto &command = frames.at(2);
		if (command.size() != 1) {
			throw mdp::unknown_command_error("Unknown worker command " + helpers::string_to_hex(command));
		}

		switch (static_cast<mdp::command>(command.front())) {
		case mdp::command::ready:
			if (frames.size() < 4) {
				throw mdp::protocol_error("READY without service name");
			}

			result.type = mdp::event_type::worker_ready;
			result.service_name = frames.at(3);
			return;
		case mdp::command::reply:
			if (frames.size() < 5 || !frames.at(4).empty()) {
				throw mdp::protocol_error("REPLY without client address envelope");
			}

			result.type = mdp::event_type::worker_reply;
			result.client = frames.at(3);
			result.body.assign(std::begin(frames) + 5, std::end(frames));
			return;
		case mdp::command::heartbeat: result.type = mdp::event_type::worker_heartbeat; return;
		case mdp::command::disconnect: result.type = mdp::event_type::worker_disconnect; return;
		case mdp::command::request: break;
		}

		throw mdp::unknown_command_error("Unknown worker command " + helpers::string_to_hex(command));
	}

	message_container encode_worker_command(
		const std::string &key, const std::string &worker, mdp::command cmd, const std::vector<std::string> &frames)
	{
		message_container result(key, worker, {"", mdp::WORKER_TAG, mdp::command_frame(cmd)});
		result.data.insert(std::end(result.data), std::begin(frames), std::end(frames));
		return result;
	}
}

mdp::event mdp::decode(const message_container &message)
{
	auto &frames = message.data;

	if (frames.size() < 2) {
		throw protocol_error("Message has only " + std::to_string(frames.size()) + " frames");
	}

	if (!frames.at(0).empty()) {
		throw protocol_error("Message does not start with an empty delimiter frame");
	}

	event result;
	result.sender = message.identity;

	if (frames.at(1) == CLIENT_TAG) {
		decode_client(frames, result);
	} else if (frames.at(1) == WORKER_TAG) {
		decode_worker(frames, result);
	} else {
		throw protocol_error("Unknown originator " + helpers::string_to_hex(frames.at(1)));
	}

	return result;
}

message_container mdp::encode_request(const std::string &key,
	const std::string &worker,
	const std::string &client,
	const std::vector<std::string> &body)
{
	std::vector<std::string> frames = {client, ""};
	frames.insert(std::end(frames), std::begin(body), std::end(body));

	return encode_worker_command(key, worker, command::request, frames);
}

message_container mdp::encode_heartbeat(const std::string &key, const std::string &worker)
{
	return encode_worker_command(key, worker, command::heartbeat, {});
}

message_container mdp::encode_disconnect(const std::string &key, const std::string &worker)
{
	return encode_worker_command(key, worker, command::disconnect, {});
}

message_container mdp::encode_reply(const std::string &key,
	const std::string &client,
	const std::string &service_name,
	const std::vector<std::string> &body)
{
	message_container result(key, client, {"", CLIENT_TAG, service_name});
	result.data.insert(std::end(result.data), std::begin(body), std::end(body));
	return result;
}

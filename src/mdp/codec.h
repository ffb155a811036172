#ifndef MDBROKER_MDP_CODEC_H
#define MDBROKER_MDP_CODEC_H

#include <stdexcept>
#include <string>
#include <vector>

#include "../reactor/message_container.h"
#include "protocol.h"

/**
 * Translation between multipart messages of the broker socket and typed protocol events.
 *
 * A received message is expected to look like
 *   [sender] [empty] [originator tag] [command or service] [frames...]
 * where the sender is the @a identity of the message container and the rest is its @a data.
 */
namespace mdp
{
	/**
	 * A message which does not follow the protocol (bad framing, unknown originator, missing frames).
	 */
	class protocol_error : public std::runtime_error
	{
	public:
		/**
		 * @param msg description of the problem
		 */
		explicit protocol_error(const std::string &msg);
	};

	/**
	 * A well framed worker message with a command the broker does not accept.
	 */
	class unknown_command_error : public protocol_error
	{
	public:
		/**
		 * @param msg description of the problem
		 */
		explicit unknown_command_error(const std::string &msg);
	};

	/** Kinds of events the broker reacts to */
	enum class event_type { client_request, worker_ready, worker_reply, worker_heartbeat, worker_disconnect };

	/**
	 * A decoded message. Only the fields relevant for the event type are filled.
	 */
	struct event {
		/** What happened */
		event_type type = event_type::client_request;

		/** Raw transport address of the sender */
		std::string sender;

		/** Requested service (client_request) or declared service (worker_ready) */
		std::string service_name;

		/** Address of the client a reply is destined to (worker_reply) */
		std::string client;

		/** Opaque body frames (client_request, worker_reply) */
		std::vector<std::string> body;
	};

	/**
	 * Decode a received message.
	 * @param message message from the broker socket
	 * @return the decoded event
	 * @throws unknown_command_error for an unsupported worker command
	 * @throws protocol_error for any other malformed message
	 */
	event decode(const message_container &message);

	/**
	 * Build a REQUEST for a worker.
	 * @param key destination key of the message
	 * @param worker raw address of the worker
	 * @param client raw address of the client which sent the request
	 * @param body request body frames
	 */
	message_container encode_request(const std::string &key,
		const std::string &worker,
		const std::string &client,
		const std::vector<std::string> &body);

	/**
	 * Build a HEARTBEAT for a worker.
	 * @param key destination key of the message
	 * @param worker raw address of the worker
	 */
	message_container encode_heartbeat(const std::string &key, const std::string &worker);

	/**
	 * Build a DISCONNECT for a worker.
	 * @param key destination key of the message
	 * @param worker raw address of the worker
	 */
	message_container encode_disconnect(const std::string &key, const std::string &worker);

	/**
	 * Build a reply for a client.
	 * @param key destination key of the message
	 * @param client raw address of the client
	 * @param service_name the service which processed the request
	 * @param body reply body frames
	 */
	message_container encode_reply(const std::string &key,
		const std::string &client,
		const std::string &service_name,
		const std::vector<std::string> &body);
}

#endif // MDBROKER_MDP_CODEC_H

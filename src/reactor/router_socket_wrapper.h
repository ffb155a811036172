#ifndef MDBROKER_ROUTER_SOCKET_WRAPPER_H
#define MDBROKER_ROUTER_SOCKET_WRAPPER_H

#include <zmq.hpp>

#include "socket_wrapper_base.h"

/**
 * Wraps a ZeroMQ router socket. The routing id of the peer is carried in the identity of the message container,
 * all other frames (including the empty delimiter) in its data.
 * Sending to a peer which is not connected fails instead of silently dropping the message.
 */
class router_socket_wrapper : public socket_wrapper_base
{
public:
	/**
	 * @param context a ZeroMQ context
	 * @param addr address used by the socket
	 * @param bound true if the socket should bind, false if it connects
	 * @param linger how long may unsent messages stay in memory after the socket is closed
	 */
	router_socket_wrapper(std::shared_ptr<zmq::context_t> context,
		const std::string &addr,
		const bool bound,
		std::chrono::milliseconds linger = std::chrono::milliseconds(0));

	~router_socket_wrapper() override = default;

	bool send_message(const message_container &message) override;

	bool receive_message(message_container &message) override;
};

#endif // MDBROKER_ROUTER_SOCKET_WRAPPER_H

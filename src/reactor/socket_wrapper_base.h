#ifndef MDBROKER_SOCKET_WRAPPER_BASE_H
#define MDBROKER_SOCKET_WRAPPER_BASE_H

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <zmq.hpp>

#include "message_container.h"

/**
 * A ZeroMQ socket together with the endpoint it binds or connects to once the reactor starts.
 * Subclasses decide how frames of the wire map to a @ref message_container.
 */
class socket_wrapper_base
{
protected:
	/** The wrapped socket */
	zmq::socket_t socket_;

	/** Endpoint of the socket */
	const std::string addr_;

	/** Bind if set, connect otherwise */
	const bool bound_;

public:
	/**
	 * @param context A ZeroMQ context used to create the socket
	 * @param type Type of the socket
	 * @param addr Endpoint used by the socket
	 * @param bound True if the socket should bind to the endpoint, false if it connects
	 * @param linger How long may unsent messages stay in memory after the socket is closed
	 */
	socket_wrapper_base(std::shared_ptr<zmq::context_t> context,
		zmq::socket_type type,
		const std::string &addr,
		const bool bound,
		std::chrono::milliseconds linger = std::chrono::milliseconds(0));

	virtual ~socket_wrapper_base() = default;

	/**
	 * Get the structure used to poll the wrapped socket for incoming messages
	 */
	zmq_pollitem_t get_pollitem();

	/**
	 * Bind or connect the socket
	 * @throws zmq::error_t when the endpoint cannot be used
	 */
	virtual void initialize();

	/**
	 * Send a message through the socket
	 * @return true on success, false otherwise
	 */
	virtual bool send_message(const message_container &) = 0;

	/**
	 * Receive a message from the socket
	 * @return true on success, false otherwise
	 */
	virtual bool receive_message(message_container &) = 0;

	/**
	 * Send frames as one multipart message.
	 * @param socket target socket
	 * @param frames at least one frame
	 * @throws zmq::error_t when a frame cannot be sent
	 */
	static void send_frames(zmq::socket_t &socket, const std::vector<std::string> &frames);

	/**
	 * Receive every part of one multipart message.
	 * @param socket source socket
	 * @param frames replaced by the received frames
	 * @param flags flags for receiving the first frame (e.g. ZMQ_DONTWAIT)
	 * @return false if no message was available
	 * @throws zmq::error_t when the receive fails
	 */
	static bool receive_frames(zmq::socket_t &socket, std::vector<std::string> &frames, int flags = 0);
};


#endif // MDBROKER_SOCKET_WRAPPER_BASE_H

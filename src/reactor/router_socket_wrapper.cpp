#include "router_socket_wrapper.h"

router_socket_wrapper::router_socket_wrapper(std::shared_ptr<zmq::context_t> context,
	const std::string &addr,
	const bool bound,
	std::chrono::milliseconds linger)
	: socket_wrapper_base(context, zmq::socket_type::router, addr, bound, linger)
{
	socket_.setsockopt(ZMQ_ROUTER_MANDATORY, 1);
}

bool router_socket_wrapper::send_message(const message_container &message)
{
	std::vector<std::string> frames;
	frames.reserve(message.data.size() + 1);
	frames.push_back(message.identity);
	frames.insert(std::end(frames), std::begin(message.data), std::end(message.data));

	try {
		send_frames(socket_, frames);
	} catch (const zmq::error_t &) {
		// EHOSTUNREACH when the peer is gone
		return false;
	}

	return true;
}

bool router_socket_wrapper::receive_message(message_container &message)
{
	std::vector<std::string> frames;

	try {
		if (!receive_frames(socket_, frames)) {
			return false;
		}
	} catch (const zmq::error_t &) {
		return false;
	}

	// The router prepends the routing id of the peer
	message.identity = frames.front();
	message.data.assign(std::begin(frames) + 1, std::end(frames));
	return true;
}

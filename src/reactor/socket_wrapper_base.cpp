#include "socket_wrapper_base.h"


socket_wrapper_base::socket_wrapper_base(std::shared_ptr<zmq::context_t> context,
	zmq::socket_type type,
	const std::string &addr,
	const bool bound,
	std::chrono::milliseconds linger)
	: socket_(*context, type), addr_(addr), bound_(bound)
{
	socket_.setsockopt(ZMQ_LINGER, static_cast<int>(linger.count()));
}

zmq_pollitem_t socket_wrapper_base::get_pollitem()
{
	return zmq_pollitem_t{(void *) socket_, 0, ZMQ_POLLIN, 0};
}

void socket_wrapper_base::initialize()
{
	if (bound_) {
		socket_.bind(addr_);
	} else {
		socket_.connect(addr_);
	}
}

void socket_wrapper_base::send_frames(zmq::socket_t &socket, const std::vector<std::string> &frames)
{
	for (std::size_t i = 0; i < frames.size(); ++i) {
		socket.send(frames[i].data(), frames[i].size(), i + 1 < frames.size() ? ZMQ_SNDMORE : 0);
	}
}

bool socket_wrapper_base::receive_frames(zmq::socket_t &socket, std::vector<std::string> &frames, int flags)
{
	zmq::message_t part;
	frames.clear();

	if (!socket.recv(&part, flags)) {
		return false;
	}

	frames.emplace_back(static_cast<char *>(part.data()), part.size());

	// The remaining parts are already queued
	while (part.more()) {
		socket.recv(&part);
		frames.emplace_back(static_cast<char *>(part.data()), part.size());
	}

	return true;
}

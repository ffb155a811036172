#include <cerrno>
#include <cstdint>

#include "../helpers/logger.h"
#include "../helpers/string_to_hex.h"
#include "reactor.h"

const std::string reactor::KEY_TIMER = "timer";
const std::string reactor::KEY_TERMINATE = "terminate";

namespace
{
	/** Frames of a message passed between the reactor and an asynchronous handler */
	std::vector<std::string> pack(const message_container &message)
	{
		std::vector<std::string> frames = {message.key, message.identity};
		frames.insert(std::end(frames), std::begin(message.data), std::end(message.data));
		return frames;
	}

	/** Inverse of @ref pack, starting at given frame */
	bool unpack(const std::vector<std::string> &frames, std::size_t offset, message_container &message)
	{
		if (frames.size() < offset + 2) {
			return false;
		}

		message.key = frames[offset];
		message.identity = frames[offset + 1];
		message.data.assign(std::begin(frames) + offset + 2, std::end(frames));
		return true;
	}
}

reactor::reactor(std::shared_ptr<zmq::context_t> context,
	std::chrono::milliseconds poll_interval,
	std::shared_ptr<spdlog::logger> logger)
	: unique_id("reactor_" + std::to_string(reinterpret_cast<std::uintptr_t>(this))), context_(context),
	  async_handler_socket_(*context, zmq::socket_type::router), poll_interval_(poll_interval), logger_(logger),
	  termination_flag_(false)
{
	if (logger_ == nullptr) {
		logger_ = helpers::create_null_logger();
	}

	async_handler_socket_.setsockopt(ZMQ_LINGER, 0);
	async_handler_socket_.bind("inproc://" + unique_id);
}

void reactor::add_socket(const std::string &name, std::shared_ptr<socket_wrapper_base> socket)
{
	sockets_.emplace(name, socket);
}

void reactor::add_handler(const std::vector<std::string> &origins, std::shared_ptr<handler_interface> handler)
{
	auto wrapper = std::make_shared<handler_wrapper>(*this, handler);

	for (auto &origin : origins) {
		handlers_.emplace(origin, wrapper);
	}
}

void reactor::add_async_handler(const std::vector<std::string> &origins, std::shared_ptr<handler_interface> handler)
{
	auto wrapper = std::make_shared<asynchronous_handler_wrapper>(*context_, async_handler_socket_, *this, handler);

	for (auto &origin : origins) {
		handlers_.emplace(origin, wrapper);
	}
}

void reactor::initialize_sockets()
{
	if (sockets_initialized_) {
		return;
	}

	for (auto &item : sockets_) {
		item.second->initialize();
	}

	sockets_initialized_ = true;
}

void reactor::send_message(const message_container &message)
{
	auto it = sockets_.find(message.key);

	if (it == std::end(sockets_)) {
		process_message(message);
		return;
	}

	if (!it->second->send_message(message)) {
		logger_->warn(
			"Sending a message to {} through socket '{}' failed", helpers::string_to_hex(message.identity), message.key);
	}
}

void reactor::process_message(const message_container &message)
{
	auto range = handlers_.equal_range(message.key);

	for (auto it = range.first; it != range.second; ++it) {
		(*it->second)(message);
	}
}

void reactor::receive_from_socket(const std::string &name)
{
	message_container message;
	message.key = name;

	if (sockets_.at(name)->receive_message(message)) {
		process_message(message);
	} else {
		logger_->warn("Receiving a message from socket '{}' failed", name);
	}
}

void reactor::receive_from_async_handler()
{
	std::vector<std::string> frames;
	message_container message;

	try {
		if (!socket_wrapper_base::receive_frames(async_handler_socket_, frames, ZMQ_DONTWAIT)) {
			return;
		}
	} catch (const zmq::error_t &e) {
		logger_->warn("Receiving a response of an asynchronous handler failed: {}", e.what());
		return;
	}

	// The first frame is the routing id of the handler thread
	if (!unpack(frames, 1, message)) {
		logger_->warn("Malformed response of an asynchronous handler");
		return;
	}

	send_message(message);
}

void reactor::start_loop()
{
	std::vector<zmq::pollitem_t> pollitems;
	std::vector<std::string> pollitem_names;

	initialize_sockets();

	for (auto &item : sockets_) {
		pollitems.push_back(item.second->get_pollitem());
		pollitem_names.push_back(item.first);
	}

	// The channel to asynchronous handlers is polled last
	pollitems.push_back(zmq_pollitem_t{(void *) async_handler_socket_, 0, ZMQ_POLLIN, 0});

	while (!termination_flag_.load()) {
		auto poll_start = std::chrono::steady_clock::now();

		try {
			zmq::poll(pollitems, poll_interval_);
		} catch (const zmq::error_t &e) {
			// EINTR means a signal arrived, the termination flag decides what happens next
			if (e.num() != EINTR) {
				logger_->error("Polling failed: {}", e.what());
			}
			continue;
		}

		auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - poll_start);

		for (std::size_t i = 0; i < pollitems.size(); ++i) {
			if (!(pollitems[i].revents & ZMQ_POLLIN)) {
				continue;
			}

			if (i < pollitem_names.size()) {
				receive_from_socket(pollitem_names[i]);
			} else {
				receive_from_async_handler();
			}
		}

		process_message(message_container(KEY_TIMER, "", {std::to_string(elapsed.count())}));
	}

	// Sockets still work, so the handlers may say goodbye
	process_message(message_container(KEY_TERMINATE, "", {}));

	handlers_.clear();
}

void reactor::terminate()
{
	termination_flag_.store(true);
}

handler_wrapper::handler_wrapper(reactor &reactor_ref, std::shared_ptr<handler_interface> handler)
	: handler_(handler), reactor_(reactor_ref)
{
}

void handler_wrapper::operator()(const message_container &message)
{
	handler_->on_request(message, [this](const message_container &response) { reactor_.send_message(response); });
}

asynchronous_handler_wrapper::asynchronous_handler_wrapper(zmq::context_t &context,
	zmq::socket_t &async_handler_socket,
	reactor &reactor_ref,
	std::shared_ptr<handler_interface> handler)
	: handler_wrapper(reactor_ref, handler), context_(context), reactor_socket_(async_handler_socket),
	  unique_id_(std::to_string(reinterpret_cast<std::uintptr_t>(this)))
{
	worker_ = std::thread([this]() { handler_thread(); });
}

asynchronous_handler_wrapper::~asynchronous_handler_wrapper()
{
	// A lone frame asks the thread to stop
	socket_wrapper_base::send_frames(reactor_socket_, {unique_id_, ""});
	worker_.join();
}

void asynchronous_handler_wrapper::operator()(const message_container &message)
{
	auto frames = pack(message);
	frames.insert(std::begin(frames), unique_id_);

	socket_wrapper_base::send_frames(reactor_socket_, frames);
}

void asynchronous_handler_wrapper::handler_thread()
{
	zmq::socket_t socket(context_, zmq::socket_type::dealer);
	socket.setsockopt(ZMQ_IDENTITY, unique_id_.data(), unique_id_.size());
	socket.setsockopt(ZMQ_LINGER, 0);
	socket.connect("inproc://" + reactor_.unique_id);

	handler_interface::response_cb respond = [&socket](const message_container &response) {
		socket_wrapper_base::send_frames(socket, pack(response));
	};

	while (true) {
		std::vector<std::string> frames;

		try {
			socket_wrapper_base::receive_frames(socket, frames);
		} catch (const zmq::error_t &e) {
			if (e.num() == EINTR) {
				continue;
			}
			return;
		}

		message_container request;
		if (!unpack(frames, 0, request)) {
			// A single frame is the stop request
			return;
		}

		handler_->on_request(request, respond);
	}
}

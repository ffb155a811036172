#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <thread>

#include "../src/reactor/reactor.h"

using namespace testing;

class pair_socket_wrapper : public socket_wrapper_base
{
public:
	pair_socket_wrapper(const std::shared_ptr<zmq::context_t> context, const std::string &addr)
		: socket_wrapper_base(context, zmq::socket_type::pair, addr, false),
		  local_socket_(*context, zmq::socket_type::pair), context_(context)
	{
		local_socket_.setsockopt(ZMQ_LINGER, 0);
		local_socket_.bind(addr_);
		socket_.close();
	}

	void initialize() override
	{
		// called by the reactor
		socket_ = zmq::socket_t(*context_, zmq::socket_type::pair);
		socket_.setsockopt(ZMQ_LINGER, 0);
		socket_.connect(addr_);
	}

	bool send_message(const message_container &message) override
	{
		return socket_send(socket_, message);
	}

	bool receive_message(message_container &message) override
	{
		return socket_receive(socket_, message);
	}

	bool send_message_local(const message_container &message)
	{
		return socket_send(local_socket_, message);
	}

	bool receive_message_local(message_container &message)
	{
		return socket_receive(local_socket_, message, true);
	}

private:
	zmq::socket_t local_socket_;
	std::shared_ptr<zmq::context_t> context_;

	bool socket_send(zmq::socket_t &socket, const message_container &message)
	{
		std::vector<std::string> frames = {message.identity};
		frames.insert(std::end(frames), std::begin(message.data), std::end(message.data));

		send_frames(socket, frames);
		return true;
	}

	bool socket_receive(zmq::socket_t &socket, message_container &message, bool noblock = false)
	{
		std::vector<std::string> frames;

		if (!receive_frames(socket, frames, noblock ? ZMQ_DONTWAIT : 0)) {
			return false;
		}

		message.identity = frames.front();
		message.data.assign(std::begin(frames) + 1, std::end(frames));
		return true;
	}
};

/**
 * A handler driven by a function passed on creation
 */
class pluggable_handler : public handler_interface
{
public:
	typedef std::function<void(const message_container &message, const response_cb &response)> fnc_t;

	std::vector<message_container> received;

	pluggable_handler(fnc_t fnc) : fnc_(fnc)
	{
	}

	static std::shared_ptr<pluggable_handler> create(fnc_t fnc)
	{
		return std::make_shared<pluggable_handler>(fnc);
	}

	void on_request(const message_container &message, const response_cb &response) override
	{
		received.push_back(message);
		fnc_(message, response);
	}

private:
	fnc_t fnc_;
};

TEST(reactor, synchronous_handler)
{
	auto context = std::make_shared<zmq::context_t>(1);
	reactor r(context);
	auto socket = std::make_shared<pair_socket_wrapper>(context, "inproc://synchronous_handler_1");
	auto handler = pluggable_handler::create([](const message_container &msg, const handler_interface::response_cb &respond) {
		respond(message_container("socket", "id1", {"Hello!"}));
	});

	r.add_socket("socket", socket);
	r.add_handler({"socket"}, handler);

	std::thread thread([&r]() { r.start_loop(); });
	std::this_thread::sleep_for(std::chrono::milliseconds(10));

	socket->send_message_local(message_container("", "id1", {"Hello??"}));
	std::this_thread::sleep_for(std::chrono::milliseconds(10));

	EXPECT_THAT(handler->received, ElementsAre(message_container("socket", "id1", {"Hello??"})));

	message_container message;
	socket->receive_message_local(message);

	EXPECT_EQ("id1", message.identity);
	EXPECT_THAT(message.data, ElementsAre("Hello!"));

	r.terminate();
	thread.join();
}

TEST(reactor, asynchronous_handler)
{
	auto context = std::make_shared<zmq::context_t>(1);
	reactor r(context);
	auto socket = std::make_shared<pair_socket_wrapper>(context, "inproc://asynchronous_handler_1");
	auto handler = pluggable_handler::create([](const message_container &msg, const handler_interface::response_cb &respond) {
		respond(message_container("socket", "id1", {"Hello!"}));
	});

	r.add_socket("socket", socket);
	r.add_async_handler({"socket"}, handler);

	std::thread thread([&r]() { r.start_loop(); });
	std::this_thread::sleep_for(std::chrono::milliseconds(10));

	socket->send_message_local(message_container("", "id1", {"Hello??"}));
	std::this_thread::sleep_for(std::chrono::milliseconds(10));

	EXPECT_THAT(handler->received, ElementsAre(message_container("socket", "id1", {"Hello??"})));

	message_container message;
	socket->receive_message_local(message);

	EXPECT_EQ("id1", message.identity);
	EXPECT_THAT(message.data, ElementsAre("Hello!"));

	r.terminate();
	thread.join();
}

TEST(reactor, timers)
{
	auto context = std::make_shared<zmq::context_t>(1);
	reactor r(context, std::chrono::milliseconds(10));
	auto handler = pluggable_handler::create(
		[](const message_container &msg, const handler_interface::response_cb &respond) {});

	r.add_handler({r.KEY_TIMER}, handler);

	std::thread thread([&r]() { r.start_loop(); });
	std::this_thread::sleep_for(std::chrono::milliseconds(200));

	r.terminate();
	thread.join();

	ASSERT_LE(2u, handler->received.size());
	ASSERT_EQ(reactor::KEY_TIMER, handler->received.front().key);
	ASSERT_EQ(1u, handler->received.front().data.size());
}

TEST(reactor, terminate_notifies_handlers)
{
	auto context = std::make_shared<zmq::context_t>(1);
	reactor r(context, std::chrono::milliseconds(10));
	auto handler = pluggable_handler::create(
		[](const message_container &msg, const handler_interface::response_cb &respond) {});

	r.add_handler({r.KEY_TERMINATE}, handler);

	std::thread thread([&r]() { r.start_loop(); });
	std::this_thread::sleep_for(std::chrono::milliseconds(50));

	ASSERT_TRUE(handler->received.empty());

	r.terminate();
	thread.join();

	ASSERT_THAT(handler->received, ElementsAre(message_container(reactor::KEY_TERMINATE, "", {})));
}

TEST(reactor, handler_to_handler)
{
	auto context = std::make_shared<zmq::context_t>(1);
	reactor r(context, std::chrono::milliseconds(10));
	auto socket = std::make_shared<pair_socket_wrapper>(context, "inproc://handler_to_handler_1");
	auto forwarder = pluggable_handler::create(
		[](const message_container &msg, const handler_interface::response_cb &respond) {
			respond(message_container("internal", msg.identity, msg.data));
		});
	auto receiver = pluggable_handler::create(
		[](const message_container &msg, const handler_interface::response_cb &respond) {
			respond(message_container("socket", msg.identity, {"Done"}));
		});

	r.add_socket("socket", socket);
	r.add_handler({"socket"}, forwarder);
	r.add_async_handler({"internal"}, receiver);

	std::thread thread([&r]() { r.start_loop(); });
	std::this_thread::sleep_for(std::chrono::milliseconds(10));

	socket->send_message_local(message_container("", "id1", {"Hello??"}));
	std::this_thread::sleep_for(std::chrono::milliseconds(50));

	message_container message;
	socket->receive_message_local(message);

	EXPECT_EQ("id1", message.identity);
	EXPECT_THAT(message.data, ElementsAre("Done"));

	r.terminate();
	thread.join();

	EXPECT_THAT(receiver->received, ElementsAre(message_container("internal", "id1", {"Hello??"})));
}

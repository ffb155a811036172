#ifndef MDBROKER_REACTOR_H
#define MDBROKER_REACTOR_H

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <thread>
#include <zmq.hpp>

#include <spdlog/logger.h>

#include "handler_interface.h"
#include "message_container.h"
#include "socket_wrapper_base.h"

/* Forward */
class reactor;

/**
 * Invokes a handler directly from the reactor thread. Responses are processed by the reactor before the call returns.
 */
class handler_wrapper
{
public:
	/**
	 * @param reactor_ref reactor which owns the handler
	 * @param handler the handler object
	 */
	handler_wrapper(reactor &reactor_ref, std::shared_ptr<handler_interface> handler);

	virtual ~handler_wrapper() = default;

	/**
	 * Pass a message to the handler
	 * @param message the message
	 */
	virtual void operator()(const message_container &message);

protected:
	/** The wrapped handler */
	std::shared_ptr<handler_interface> handler_;

	/** The reactor that owns the wrapper */
	reactor &reactor_;
};

/**
 * Runs a handler in a dedicated thread. Messages travel between the reactor and the thread through an in-process
 * DEALER socket connected to the reactor's ROUTER, so the handler never touches the reactor's sockets.
 *
 * Wire format towards the thread: [key] [identity] [data...], a single frame asks the thread to stop.
 * Responses use the same layout.
 */
class asynchronous_handler_wrapper : public handler_wrapper
{
public:
	/**
	 * @param context ZeroMQ context shared with the reactor
	 * @param async_handler_socket reactor side of the in-process channel
	 * @param reactor_ref reactor which owns the handler
	 * @param handler the handler object
	 */
	asynchronous_handler_wrapper(zmq::context_t &context,
		zmq::socket_t &async_handler_socket,
		reactor &reactor_ref,
		std::shared_ptr<handler_interface> handler);

	/**
	 * Stop the thread and wait for it. The reactor side of the channel must still be open.
	 */
	~asynchronous_handler_wrapper() override;

	/**
	 * Queue a copy of the message for the handler thread.
	 * @param message the message
	 */
	void operator()(const message_container &message) override;

private:
	/** ZeroMQ context */
	zmq::context_t &context_;

	/** Reactor side of the channel, used from the reactor thread only */
	zmq::socket_t &reactor_socket_;

	/** Routing id of the thread's DEALER socket */
	const std::string unique_id_;

	/** The handler thread */
	std::thread worker_;

	/**
	 * Body of the handler thread. Receives messages and calls the handler until asked to stop.
	 */
	void handler_thread();
};

/**
 * Event loop over ZeroMQ sockets. Every received message is tagged with the key of its socket and passed to the
 * handlers subscribed to that key. Handlers respond with messages whose key either names a socket (the message is
 * sent through it) or another key (the message is passed to its subscribers).
 */
class reactor
{
public:
	/** Key of the message emitted after every poll, its only frame is the poll duration in milliseconds */
	const static std::string KEY_TIMER;

	/** Key of the message emitted once after the loop stops, before the handlers are destroyed */
	const static std::string KEY_TERMINATE;

	/** Name of the in-process endpoint of asynchronous handlers */
	const std::string unique_id;

	/**
	 * @param context ZeroMQ context used for all sockets
	 * @param poll_interval longest wait for a message, i.e. the period of timer messages
	 * @param logger optional logger of failed sends and receives
	 */
	reactor(std::shared_ptr<zmq::context_t> context,
		std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100),
		std::shared_ptr<spdlog::logger> logger = nullptr);

	/**
	 * Register a socket to be polled.
	 * @param name key of messages received from and sent to the socket
	 * @param socket the socket
	 */
	void add_socket(const std::string &name, std::shared_ptr<socket_wrapper_base> socket);

	/**
	 * Subscribe a handler which runs in the reactor thread.
	 * @param origins keys the handler is subscribed to
	 * @param handler the handler
	 */
	void add_handler(const std::vector<std::string> &origins, std::shared_ptr<handler_interface> handler);

	/**
	 * Subscribe a handler which runs in its own thread.
	 * @param origins keys the handler is subscribed to
	 * @param handler the handler
	 */
	void add_async_handler(const std::vector<std::string> &origins, std::shared_ptr<handler_interface> handler);

	/**
	 * Bind or connect all registered sockets. Called by @ref start_loop unless it was called before.
	 * @throws zmq::error_t when a socket cannot bind or connect
	 */
	void initialize_sockets();

	/**
	 * Send a message through the socket named by its key, or pass it to the subscribers of the key.
	 * A failed send is logged.
	 * @param message the message
	 */
	void send_message(const message_container &message);

	/**
	 * Pass a message to the handlers subscribed to its key.
	 * @param message the message
	 */
	void process_message(const message_container &message);

	/**
	 * Run the loop until @ref terminate is called.
	 */
	void start_loop();

	/**
	 * Ask the loop to stop after the current cycle. Thread-safe and async-signal-safe.
	 */
	void terminate();

private:
	/** Sockets indexed by their keys */
	std::map<std::string, std::shared_ptr<socket_wrapper_base>> sockets_;

	/** Handlers indexed by the keys they are subscribed to */
	std::multimap<std::string, std::shared_ptr<handler_wrapper>> handlers_;

	/** ZeroMQ context */
	std::shared_ptr<zmq::context_t> context_;

	/** Reactor side of the channel to asynchronous handlers */
	zmq::socket_t async_handler_socket_;

	/** Timeout of one poll */
	std::chrono::milliseconds poll_interval_;

	/** A system logger */
	std::shared_ptr<spdlog::logger> logger_;

	/** Set when the loop should stop */
	std::atomic<bool> termination_flag_;

	/** Whether the sockets are already bound/connected */
	bool sockets_initialized_ = false;

	/**
	 * Receive a message from a registered socket and pass it to its subscribers.
	 */
	void receive_from_socket(const std::string &name);

	/**
	 * Receive a response of an asynchronous handler and deliver it.
	 */
	void receive_from_async_handler();
};

#endif // MDBROKER_REACTOR_H

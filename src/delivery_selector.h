#ifndef MDBROKER_DELIVERY_SELECTOR_H
#define MDBROKER_DELIVERY_SELECTOR_H

#include <functional>
#include <map>
#include <stdexcept>

#include "reactor/handler_interface.h"
#include "worker.h"

/**
 * A message cannot be delivered because nobody knows how to reach workers of its class.
 */
class delivery_error : public std::runtime_error
{
public:
	/**
	 * @param msg description of exception circumstances
	 */
	explicit delivery_error(const std::string &msg);
};

/**
 * Picks the way a message for a worker is delivered according to the class of the worker.
 * Remote workers are reached through the transport (the response callback of the reactor), every other class
 * needs a delivery function registered by the host application.
 */
class delivery_selector
{
public:
	/**
	 * Delivery function. Gets the message (identity is the raw address of the worker) and the transport callback,
	 * which may be used to route the message to another reactor handler.
	 */
	typedef std::function<void(const message_container &, const handler_interface::response_cb &)> delivery_fn;

	/**
	 * Register the delivery function of a worker class, replacing the previous one.
	 * @param type worker class (the zmq class always uses the transport)
	 * @param fn delivery function
	 */
	void set_delivery(worker_class type, delivery_fn fn);

	/**
	 * Deliver a message to a worker.
	 * @param type class of the receiving worker
	 * @param message the message
	 * @param transport response callback of the reactor
	 * @throws delivery_error if there is no delivery function for the class
	 */
	void deliver(worker_class type, const message_container &message, const handler_interface::response_cb &transport) const;

private:
	/** Delivery functions of in-process worker classes */
	std::map<worker_class, delivery_fn> functions_;
};

#endif // MDBROKER_DELIVERY_SELECTOR_H

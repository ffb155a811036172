#ifndef MDBROKER_HANDLER_INTERFACE_H
#define MDBROKER_HANDLER_INTERFACE_H

#include <functional>

#include "message_container.h"

/**
 * Something the reactor passes messages to.
 */
class handler_interface
{
public:
	virtual ~handler_interface() = default;

	/**
	 * Callback the handler uses to emit messages. A message keyed by a socket name leaves through that socket,
	 * any other key hands it to the handlers subscribed to the key.
	 */
	using response_cb = std::function<void(const message_container &)>;

	/**
	 * Process a message with a key the handler is subscribed to
	 * @param message the message
	 * @param respond callback for emitting messages, valid only during the call
	 */
	virtual void on_request(const message_container &message, const response_cb &respond) = 0;
};

#endif // MDBROKER_HANDLER_INTERFACE_H

#include "delivery_selector.h"

delivery_error::delivery_error(const std::string &msg) : std::runtime_error(msg)
{
}

void delivery_selector::set_delivery(worker_class type, delivery_fn fn)
{
	functions_[type] = fn;
}

void delivery_selector::deliver(
	worker_class type, const message_container &message, const handler_interface::response_cb &transport) const
{
	if (type == worker_class::zmq) {
		transport(message);
		return;
	}

	auto it = functions_.find(type);
	if (it == std::end(functions_)) {
		throw delivery_error("No delivery function for " + worker_identity::class_tag(type) + " workers");
	}

	(it->second)(message, transport);
}

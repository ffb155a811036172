#include "service.h"

#include <algorithm>


client_request::client_request(
	const std::string &client_identity, const std::vector<std::string> &body, broker_clock::time_point received_at)
	: client_identity(client_identity), body(body), received_at(received_at)
{
}

service::service(const std::string &name) : name(name)
{
}

bool service::remove_worker(const std::string &identity)
{
	auto it = std::find(std::begin(workers), std::end(workers), identity);

	if (it == std::end(workers)) {
		return false;
	}

	workers.erase(it);
	return true;
}

bool service::is_idle() const
{
	return requests.empty() && workers.empty();
}

#ifndef MDBROKER_MESSAGE_CONTAINER_H
#define MDBROKER_MESSAGE_CONTAINER_H

#include <string>
#include <vector>

/**
 * A multipart message as seen by the reactor and its handlers.
 */
struct message_container {
	/** Reactor key, i.e. the socket or the event the message comes from or goes to */
	std::string key;

	/** Transport address of the peer, empty for internal events */
	std::string identity = "";

	/** Remaining frames */
	std::vector<std::string> data;

	message_container() = default;

	/**
	 * @param key reactor key
	 * @param identity transport address of the peer
	 * @param data remaining frames
	 */
	message_container(const std::string &key, const std::string &identity, const std::vector<std::string> &data);

	/**
	 * Two messages are equal if they have the same key, identity and frames
	 */
	bool operator==(const message_container &other) const;

	/**
	 * Describe the message for logging, binary identity and frames are hex encoded.
	 * @return key, identity and frames of the message
	 */
	std::string to_string() const;
};

#endif // MDBROKER_MESSAGE_CONTAINER_H

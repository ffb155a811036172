#ifndef MDBROKER_MDP_PROTOCOL_H
#define MDBROKER_MDP_PROTOCOL_H

#include <string>

/**
 * Constants of the Majordomo Protocol 0.1 (http://rfc.zeromq.org/spec:7).
 */
namespace mdp
{
	/** Originator tag of client messages (and of replies sent to clients) */
	const std::string CLIENT_TAG = "MDPC01";

	/** Originator tag of worker messages (and of commands sent to workers) */
	const std::string WORKER_TAG = "MDPW01";

	/** Commands exchanged between the broker and workers, each sent as a one byte frame */
	enum class command : char {
		ready = 0x01,
		request = 0x02,
		reply = 0x03,
		heartbeat = 0x04,
		disconnect = 0x05
	};

	/**
	 * Get the frame which carries a command.
	 * @param cmd the command
	 * @return one byte frame
	 */
	inline std::string command_frame(command cmd)
	{
		return std::string(1, static_cast<char>(cmd));
	}
}

#endif // MDBROKER_MDP_PROTOCOL_H

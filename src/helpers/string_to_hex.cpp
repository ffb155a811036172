#include "string_to_hex.h"

std::string helpers::string_to_hex(const std::string &string)
{
	std::stringstream ss;
	ss << std::hex << std::setfill('0') << std::nouppercase;
	for (auto &c : string) {
		ss << std::setw(2) << static_cast<unsigned int>(static_cast<unsigned char>(c));
	}
	return ss.str();
}

std::string helpers::frames_to_hex(const std::vector<std::string> &frames)
{
	std::string result;

	for (auto it = std::begin(frames); it != std::end(frames); ++it) {
		result += it->empty() ? "[]" : string_to_hex(*it);
		if (std::next(it) != std::end(frames)) {
			result += " ";
		}
	}

	return result;
}

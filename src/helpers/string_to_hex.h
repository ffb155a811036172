#ifndef MDBROKER_STRING_TO_HEX_H
#define MDBROKER_STRING_TO_HEX_H

#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace helpers
{
	/**
	 * Converts all characters to its hexadecimal representation and return it in form of textual concatenation.
	 * @param string text which will be converted to its binary representation
	 * @return textual description of hexadecimal characters from given string
	 */
	std::string string_to_hex(const std::string &string);

	/**
	 * Describe a multipart message, every frame converted by @ref string_to_hex.
	 * @param frames frames of the message
	 * @return frames separated by spaces, empty frames shown as "[]"
	 */
	std::string frames_to_hex(const std::vector<std::string> &frames);
}


#endif // MDBROKER_STRING_TO_HEX_H

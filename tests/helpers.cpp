#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../src/helpers/logger.h"
#include "../src/helpers/string_to_hex.h"
#include "../src/reactor/message_container.h"

TEST(helpers, string_to_hex)
{
	ASSERT_EQ("", helpers::string_to_hex(""));
	ASSERT_EQ("6869", helpers::string_to_hex("hi"));
	ASSERT_EQ("0001ff80", helpers::string_to_hex(std::string("\0\x01\xff\x80", 4)));
}

TEST(helpers, frames_to_hex)
{
	ASSERT_EQ("", helpers::frames_to_hex({}));
	ASSERT_EQ("[] 4d4450433031 31", helpers::frames_to_hex({"", "MDPC01", "1"}));
}

TEST(helpers, message_description)
{
	message_container message("broker", "id", {"", "\x01"});

	ASSERT_EQ("broker <6964> [] 01", message.to_string());
}

TEST(helpers, log_levels)
{
	ASSERT_EQ(spdlog::level::off, helpers::get_log_level("off"));
	ASSERT_EQ(spdlog::level::err, helpers::get_log_level("err"));
	ASSERT_EQ(spdlog::level::info, helpers::get_log_level("info"));
	ASSERT_EQ(spdlog::level::trace, helpers::get_log_level("unknown"));
}

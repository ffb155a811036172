#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <yaml-cpp/yaml.h>

#include "../src/config/broker_config.h"

TEST(broker_config, config_basic)
{
	auto yaml = YAML::Load(
		"address: tcp://127.0.0.1:5555\n"
		"poll_interval: 250\n"
		"heartbeat: 5\n"
		"heartbeat_mult: 3\n"
		"log_details: true\n"
		"linger: 1000\n"
		"logger:\n"
		"    file: /var/log/mdbroker\n"
		"    level: emerg\n"
		"    max-size: 2048576\n"
		"    rotations: 5\n"
	);

	broker_config config(yaml);

	log_config expected_log;
	expected_log.log_path = "/var/log";
	expected_log.log_basename = "mdbroker";
	expected_log.log_level = "emerg";
	expected_log.log_file_size = 2048576;
	expected_log.log_files_count = 5;

	ASSERT_EQ("tcp://127.0.0.1:5555", config.get_address());
	ASSERT_EQ(std::chrono::milliseconds(250), config.get_poll_interval());
	ASSERT_EQ(std::chrono::seconds(5), config.get_heartbeat_interval());
	ASSERT_EQ(3u, config.get_heartbeat_multiplier());
	ASSERT_TRUE(config.get_log_details());
	ASSERT_EQ(std::chrono::milliseconds(1000), config.get_linger());
	ASSERT_EQ(expected_log, config.get_log_config());
}

TEST(broker_config, defaults)
{
	auto yaml = YAML::Load("logger:\n    level: debug\n");

	broker_config config(yaml);

	ASSERT_EQ("tcp://*:47047", config.get_address());
	ASSERT_EQ(std::chrono::milliseconds(100), config.get_poll_interval());
	ASSERT_EQ(std::chrono::seconds(3), config.get_heartbeat_interval());
	ASSERT_EQ(2u, config.get_heartbeat_multiplier());
	ASSERT_FALSE(config.get_log_details());
	ASSERT_EQ(std::chrono::milliseconds(0), config.get_linger());
	ASSERT_EQ("debug", config.get_log_config().log_level);
}

TEST(broker_config, invalid_heartbeat)
{
	auto yaml = YAML::Load(
		"heartbeat: foo\n"
	);

	ASSERT_THROW(broker_config config(yaml), config_error);
}

TEST(broker_config, zero_heartbeat)
{
	auto yaml = YAML::Load(
		"heartbeat: 0\n"
	);

	ASSERT_THROW(broker_config config(yaml), config_error);
}

TEST(broker_config, zero_multiplier)
{
	auto yaml = YAML::Load(
		"heartbeat_mult: 0\n"
	);

	ASSERT_THROW(broker_config config(yaml), config_error);
}

TEST(broker_config, invalid_log_details)
{
	auto yaml = YAML::Load(
		"log_details: maybe\n"
	);

	ASSERT_THROW(broker_config config(yaml), config_error);
}

TEST(broker_config, invalid_document)
{
	auto yaml = YAML::Load(
		"[1, 2, 3]\n"
	);

	ASSERT_THROW(broker_config config(yaml), config_error);
}

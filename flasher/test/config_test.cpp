/**
romflash ROM Bootloader Flasher
Copyright (C)  2025 Seneral <contact@seneral.dev> and contributors

MIT License

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/

#include "config.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <filesystem>

TEST(Config, Defaults)
{
	FlasherConfig config;
	EXPECT_EQ(config.syncBaudRate, 115200u);
	EXPECT_EQ(config.flashBaudRate, 115200u);
	EXPECT_EQ(config.blockSize, 1024u);
	EXPECT_EQ(config.syncAttempts, 10);
	EXPECT_FALSE(config.strictSync);
	EXPECT_TRUE(config.validateResponses);
	EXPECT_FALSE(config.allowUnknownImage);
	EXPECT_TRUE(config.reboot);
	EXPECT_EQ(config.timing.syncDelayMS, 100);
	EXPECT_EQ(config.timing.blockDelayMS, 5);
	EXPECT_EQ(config.timing.endSettleMS, 1000);
	EXPECT_EQ(config.timing.deadlineMS, 0);
	EXPECT_FALSE(config_validate(config));
}

TEST(Config, ParsesSections)
{
	FlasherConfig config;
	auto error = parseFlasherConfig(R"({
		"serial": { "flashBaudRate": 460800 },
		"protocol": { "strictSync": true, "syncAttempts": 4, "reboot": false },
		"timing": { "blockDelayMS": 0, "deadlineMS": 60000 }
	})", config);
	ASSERT_FALSE(error) << error->msg;
	EXPECT_EQ(config.flashBaudRate, 460800u);
	EXPECT_EQ(config.syncBaudRate, 115200u);
	EXPECT_TRUE(config.strictSync);
	EXPECT_EQ(config.syncAttempts, 4);
	EXPECT_FALSE(config.reboot);
	EXPECT_EQ(config.timing.blockDelayMS, 0);
	EXPECT_EQ(config.timing.deadlineMS, 60000);
	EXPECT_EQ(config.timing.syncDelayMS, 100);
}

TEST(Config, RejectsInvalid)
{
	FlasherConfig config;
	for (const char *text : {
		"not json",
		"[1, 2]",
		R"({ "protocol": { "syncAttempts": "many" } })",
		R"({ "protocol": { "syncAttempts": 0 } })",
		R"({ "protocol": { "blockSize": 0 } })",
		R"({ "timing": { "blockDelayMS": -5 } })",
		R"({ "serial": { "syncBaudRate": -1 } })",
		R"({ "serial": { "flashBaudRate": 4294967296 } })",
		R"({ "serial": { "flashBaudRate": 115200.5 } })",
		R"({ "protocol": { "blockSize": -1024 } })" })
	{
		auto error = parseFlasherConfig(text, config);
		ASSERT_TRUE(error) << text;
		EXPECT_EQ(error->kind(), FLASH_ERROR_INVALID_CONFIG) << text;
		config = FlasherConfig();
	}
}

TEST(Config, ReadsFile)
{
	auto path = std::filesystem::temp_directory_path() / "romflash_config_test.json";
	{
		std::ofstream fs(path);
		fs << R"({ "protocol": { "allowUnknownImage": true } })";
	}
	FlasherConfig config;
	auto error = parseFlasherConfigFile(path.string(), config);
	ASSERT_FALSE(error) << error->msg;
	EXPECT_TRUE(config.allowUnknownImage);
	std::filesystem::remove(path);

	error = parseFlasherConfigFile(path.string(), config);
	ASSERT_TRUE(error);
	EXPECT_EQ(error->kind(), FLASH_ERROR_INVALID_CONFIG);
}

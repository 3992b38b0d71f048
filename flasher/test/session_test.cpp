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

#include "flash/session.hpp"
#include "mock_transport.hpp"

#include <gtest/gtest.h>

struct SessionRun
{
	FlashEvent result;
	std::vector<FlashEvent> events;
};

static SessionRun runSession(std::shared_ptr<MockBootloader> device, std::vector<uint8_t> image,
	const FlasherConfig &config, FlashAddress address = { "Application", 0x10000, "" })
{
	SessionRun run;
	FlashSession session(std::make_unique<MockTransport>(device), address, std::move(image), config);
	run.result = session.run(std::stop_token(), [&](const FlashEvent &event) { run.events.push_back(event); });
	return run;
}

static bool hasPhase(const std::vector<FlashEvent> &events, FlashPhase phase)
{
	return std::any_of(events.begin(), events.end(), [&](const FlashEvent &e) { return e.phase == phase; });
}

TEST(FlashSession, FlashesImageInPaddedBlocks)
{
	auto device = std::make_shared<MockBootloader>();
	auto image = testImage(2500);
	auto run = runSession(device, image, testConfig());

	ASSERT_EQ(run.result.type, FLASH_EVENT_SUCCESS) << run.result.message;
	EXPECT_EQ(run.result.phase, FlashPhase::Done);
	EXPECT_FLOAT_EQ(run.result.progress, 1.0f);
	EXPECT_EQ(run.result.address, 0x10000u);
	EXPECT_EQ(run.result.sizeBytes, 2500u);
	EXPECT_EQ(run.result.chip, ChipFamily::Esp32);
	ASSERT_FALSE(run.events.empty());
	EXPECT_EQ(run.events.back().type, FLASH_EVENT_SUCCESS);

	auto begin = device->requests(CMD_FLASH_BEGIN);
	ASSERT_EQ(begin.size(), 1u);
	ASSERT_EQ(begin[0].payload.size(), 16u);
	EXPECT_EQ(readLE32(begin[0].payload.data()+0), 3072u);
	EXPECT_EQ(readLE32(begin[0].payload.data()+4), 3u);
	EXPECT_EQ(readLE32(begin[0].payload.data()+8), 1024u);
	EXPECT_EQ(readLE32(begin[0].payload.data()+12), 0x10000u);

	auto data = device->requests(CMD_FLASH_DATA);
	ASSERT_EQ(data.size(), 3u);
	for (uint32_t i = 0; i < data.size(); i++)
	{
		ASSERT_EQ(data[i].payload.size(), 16u + 1024u);
		EXPECT_EQ(readLE32(data[i].payload.data()+0), 1024u);
		EXPECT_EQ(readLE32(data[i].payload.data()+4), i);
	}
	const auto &last = data[2].payload;
	EXPECT_EQ(last[16 + 451], image[2499]);
	for (int i = 452; i < 1024; i++)
		ASSERT_EQ(last[16 + i], 0xFF) << "at " << i;

	auto end = device->requests(CMD_FLASH_END);
	ASSERT_EQ(end.size(), 1u);
	EXPECT_EQ(end[0].payload[0], FLASH_END_REBOOT);

	EXPECT_FALSE(device->open);
	EXPECT_EQ(device->closes, 1);
}

TEST(FlashSession, CommandOrder)
{
	auto device = std::make_shared<MockBootloader>();
	auto run = runSession(device, testImage(1500), testConfig());
	ASSERT_EQ(run.result.type, FLASH_EVENT_SUCCESS) << run.result.message;
	std::vector<uint8_t> expected = { CMD_SYNC, CMD_FLASH_BEGIN, CMD_FLASH_DATA, CMD_FLASH_DATA, CMD_FLASH_END };
	EXPECT_EQ(device->opcodes(), expected);
}

TEST(FlashSession, ProgressIsMonotonic)
{
	auto device = std::make_shared<MockBootloader>();
	auto run = runSession(device, testImage(4096), testConfig());
	ASSERT_EQ(run.result.type, FLASH_EVENT_SUCCESS) << run.result.message;

	float progress = 0.0f;
	for (const auto &event : run.events)
	{
		EXPECT_GE(event.progress, progress) << event.message;
		EXPECT_LE(event.progress, 1.0f);
		progress = event.progress;
	}

	std::vector<float> written;
	for (const auto &event : run.events)
		if (event.phase == FlashPhase::Writing && event.progress > FLASH_PROGRESS_SYNCED)
			written.push_back(event.progress);
	ASSERT_EQ(written.size(), 4u);
	EXPECT_FLOAT_EQ(written[0], 0.3f);
	EXPECT_FLOAT_EQ(written[3], 0.9f);
	EXPECT_TRUE(hasPhase(run.events, FlashPhase::Finalizing));
}

TEST(FlashSession, PermissiveSyncProceedsWithWarning)
{
	auto device = std::make_shared<MockBootloader>();
	device->silentSyncs = 1000;
	FlasherConfig config = testConfig();
	config.validateResponses = false;
	auto run = runSession(device, testImage(100), config);

	ASSERT_EQ(run.result.type, FLASH_EVENT_SUCCESS) << run.result.message;
	EXPECT_EQ(device->requests(CMD_SYNC).size(), 3u);
	auto warning = std::find_if(run.events.begin(), run.events.end(), [](const FlashEvent &e) { return e.warning; });
	ASSERT_NE(warning, run.events.end());
	EXPECT_EQ(warning->error, FLASH_ERROR_SYNC_TIMEOUT);
	EXPECT_EQ(warning->type, FLASH_EVENT_STATUS);
	EXPECT_TRUE(hasPhase(run.events, FlashPhase::Erasing));
}

TEST(FlashSession, StrictSyncFails)
{
	auto device = std::make_shared<MockBootloader>();
	device->silentSyncs = 1000;
	FlasherConfig config = testConfig();
	config.strictSync = true;
	auto run = runSession(device, testImage(100), config);

	EXPECT_EQ(run.result.type, FLASH_EVENT_FAILURE);
	EXPECT_EQ(run.result.error, FLASH_ERROR_SYNC_TIMEOUT);
	EXPECT_EQ(run.result.phase, FlashPhase::Failed);
	EXPECT_FLOAT_EQ(run.result.progress, 0.0f);
	EXPECT_TRUE(device->requests(CMD_FLASH_BEGIN).empty());
	EXPECT_FALSE(hasPhase(run.events, FlashPhase::Erasing));
	EXPECT_FALSE(device->open);
}

TEST(FlashSession, SyncSucceedsAfterRetries)
{
	auto device = std::make_shared<MockBootloader>();
	device->silentSyncs = 2;
	FlasherConfig config = testConfig();
	config.strictSync = true;
	auto run = runSession(device, testImage(100), config);

	ASSERT_EQ(run.result.type, FLASH_EVENT_SUCCESS) << run.result.message;
	EXPECT_EQ(device->requests(CMD_SYNC).size(), 3u);
}

TEST(FlashSession, OpenFailure)
{
	auto device = std::make_shared<MockBootloader>();
	device->openFails = true;
	auto run = runSession(device, testImage(100), testConfig());

	EXPECT_EQ(run.result.type, FLASH_EVENT_FAILURE);
	EXPECT_EQ(run.result.error, FLASH_ERROR_TRANSPORT_UNAVAILABLE);
	EXPECT_TRUE(device->writes.empty());
	EXPECT_FALSE(hasPhase(run.events, FlashPhase::Syncing));
}

TEST(FlashSession, WriteFailureMidSession)
{
	auto device = std::make_shared<MockBootloader>();
	device->failWriteAt = 2; // Sync, flash begin, then the first data block
	auto run = runSession(device, testImage(3000), testConfig());

	EXPECT_EQ(run.result.type, FLASH_EVENT_FAILURE);
	EXPECT_EQ(run.result.error, FLASH_ERROR_WRITE_REJECTED);
	EXPECT_TRUE(device->requests(CMD_FLASH_DATA).empty());
	EXPECT_TRUE(device->requests(CMD_FLASH_END).empty());
	EXPECT_FALSE(device->open);
	EXPECT_EQ(device->closes, 1);
}

TEST(FlashSession, CancelWhileWriting)
{
	auto device = std::make_shared<MockBootloader>();
	std::stop_source stop;
	std::vector<FlashEvent> events;
	FlashSession session(std::make_unique<MockTransport>(device), { "Application", 0x10000, "" }, testImage(5000), testConfig());
	FlashEvent result = session.run(stop.get_token(), [&](const FlashEvent &event)
	{
		events.push_back(event);
		if (event.phase == FlashPhase::Writing)
			stop.request_stop();
	});

	EXPECT_EQ(result.type, FLASH_EVENT_FAILURE);
	EXPECT_EQ(result.error, FLASH_ERROR_CANCELLED);
	EXPECT_TRUE(device->requests(CMD_FLASH_DATA).empty());
	EXPECT_TRUE(device->requests(CMD_FLASH_END).empty());
	EXPECT_FALSE(device->open);
	EXPECT_EQ(session.getPhase(), FlashPhase::Failed);
}

TEST(FlashSession, DeadlineExpires)
{
	auto device = std::make_shared<MockBootloader>();
	device->writeDelayMS = 20;
	FlasherConfig config = testConfig();
	config.timing.deadlineMS = 5;
	auto run = runSession(device, testImage(5000), config);

	EXPECT_EQ(run.result.type, FLASH_EVENT_FAILURE);
	EXPECT_EQ(run.result.error, FLASH_ERROR_TIMEOUT);
	EXPECT_TRUE(device->requests(CMD_FLASH_END).empty());
}

TEST(FlashSession, EmptyImage)
{
	auto device = std::make_shared<MockBootloader>();
	auto run = runSession(device, {}, testConfig());

	EXPECT_EQ(run.result.type, FLASH_EVENT_FAILURE);
	EXPECT_EQ(run.result.error, FLASH_ERROR_EMPTY_IMAGE);
	EXPECT_EQ(device->opens, 0);
}

TEST(FlashSession, UnknownImageRejected)
{
	auto device = std::make_shared<MockBootloader>();
	auto run = runSession(device, testImage(100, 0x42), testConfig());

	EXPECT_EQ(run.result.type, FLASH_EVENT_FAILURE);
	EXPECT_EQ(run.result.error, FLASH_ERROR_UNRECOGNIZED_IMAGE);
	EXPECT_EQ(device->opens, 0);
}

TEST(FlashSession, UnknownImageAllowed)
{
	auto device = std::make_shared<MockBootloader>();
	FlasherConfig config = testConfig();
	config.allowUnknownImage = true;
	auto run = runSession(device, testImage(100, 0x42), config);

	ASSERT_EQ(run.result.type, FLASH_EVENT_SUCCESS) << run.result.message;
	EXPECT_EQ(run.result.chip, ChipFamily::Unknown);
	auto warning = std::find_if(run.events.begin(), run.events.end(), [](const FlashEvent &e) { return e.warning; });
	ASSERT_NE(warning, run.events.end());
	EXPECT_EQ(warning->error, FLASH_ERROR_UNRECOGNIZED_IMAGE);
}

TEST(FlashSession, FailedResponseStatus)
{
	auto device = std::make_shared<MockBootloader>();
	device->failStatus[CMD_FLASH_DATA] = 1;
	auto run = runSession(device, testImage(3000), testConfig());

	EXPECT_EQ(run.result.type, FLASH_EVENT_FAILURE);
	EXPECT_EQ(run.result.error, FLASH_ERROR_RESPONSE_MISMATCH);
	EXPECT_EQ(device->requests(CMD_FLASH_DATA).size(), 1u);
	EXPECT_TRUE(device->requests(CMD_FLASH_END).empty());
}

TEST(FlashSession, MissingResponse)
{
	auto device = std::make_shared<MockBootloader>();
	device->answerCommands = false;
	auto run = runSession(device, testImage(3000), testConfig());

	EXPECT_EQ(run.result.type, FLASH_EVENT_FAILURE);
	EXPECT_EQ(run.result.error, FLASH_ERROR_RESPONSE_MISMATCH);
	EXPECT_TRUE(device->requests(CMD_FLASH_DATA).empty());
}

TEST(FlashSession, NoiseBetweenResponsesIsSkipped)
{
	auto device = std::make_shared<MockBootloader>();
	device->noise = { 0x12, 0x34, SLIP_END, SLIP_END };
	auto run = runSession(device, testImage(3000), testConfig());
	ASSERT_EQ(run.result.type, FLASH_EVENT_SUCCESS) << run.result.message;
}

TEST(FlashSession, ShortStatusDeviceWithEsp32Image)
{
	auto device = std::make_shared<MockBootloader>();
	device->statusBytes = 2;
	auto run = runSession(device, testImage(3000, IMAGE_MAGIC_ESP32), testConfig());

	ASSERT_EQ(run.result.type, FLASH_EVENT_SUCCESS) << run.result.message;
	EXPECT_EQ(run.result.chip, ChipFamily::Esp32);
	EXPECT_EQ(device->requests(CMD_FLASH_DATA).size(), 3u);
}

TEST(FlashSession, LongStatusFailureWithEsp8266Image)
{
	auto device = std::make_shared<MockBootloader>();
	device->statusBytes = 4;
	device->failStatus[CMD_FLASH_BEGIN] = 1;
	auto run = runSession(device, testImage(100, IMAGE_MAGIC_ESP8266), testConfig());

	EXPECT_EQ(run.result.type, FLASH_EVENT_FAILURE);
	EXPECT_EQ(run.result.error, FLASH_ERROR_RESPONSE_MISMATCH);
	EXPECT_EQ(run.result.chip, ChipFamily::Esp8266);
	EXPECT_TRUE(device->requests(CMD_FLASH_DATA).empty());
}

TEST(FlashSession, ShortStatusFailureIsDetected)
{
	auto device = std::make_shared<MockBootloader>();
	device->statusBytes = 2;
	device->failStatus[CMD_FLASH_DATA] = 1;
	auto run = runSession(device, testImage(3000, IMAGE_MAGIC_ESP32), testConfig());

	EXPECT_EQ(run.result.type, FLASH_EVENT_FAILURE);
	EXPECT_EQ(run.result.error, FLASH_ERROR_RESPONSE_MISMATCH);
	EXPECT_EQ(device->requests(CMD_FLASH_DATA).size(), 1u);
}

TEST(FlashSession, SwitchesBaudRateAfterSync)
{
	auto device = std::make_shared<MockBootloader>();
	FlasherConfig config = testConfig();
	config.flashBaudRate = 460800;
	auto run = runSession(device, testImage(100), config);

	ASSERT_EQ(run.result.type, FLASH_EVENT_SUCCESS) << run.result.message;
	auto change = device->requests(CMD_CHANGE_BAUDRATE);
	ASSERT_EQ(change.size(), 1u);
	EXPECT_EQ(readLE32(change[0].payload.data()), 460800u);
	EXPECT_EQ(device->baudRate, 460800u);
	std::vector<uint8_t> expected = { CMD_SYNC, CMD_CHANGE_BAUDRATE, CMD_FLASH_BEGIN, CMD_FLASH_DATA, CMD_FLASH_END };
	EXPECT_EQ(device->opcodes(), expected);
}

TEST(FlashSession, StayInBootloader)
{
	auto device = std::make_shared<MockBootloader>();
	FlasherConfig config = testConfig();
	config.reboot = false;
	auto run = runSession(device, testImage(100), config);

	ASSERT_EQ(run.result.type, FLASH_EVENT_SUCCESS) << run.result.message;
	auto end = device->requests(CMD_FLASH_END);
	ASSERT_EQ(end.size(), 1u);
	EXPECT_EQ(end[0].payload[0], FLASH_END_STAY);
}

TEST(FlashSession, SecondRunIsRejected)
{
	auto device = std::make_shared<MockBootloader>();
	FlashSession session(std::make_unique<MockTransport>(device), { "Application", 0x10000, "" }, testImage(100), testConfig());
	FlashEvent first = session.run(std::stop_token(), [](const FlashEvent&) {});
	ASSERT_EQ(first.type, FLASH_EVENT_SUCCESS) << first.message;
	std::size_t writes = device->writes.size();

	FlashEvent second = session.run(std::stop_token(), [](const FlashEvent&) {});
	EXPECT_EQ(second.type, FLASH_EVENT_FAILURE);
	EXPECT_EQ(second.error, FLASH_ERROR_SESSION_REUSED);
	EXPECT_EQ(device->writes.size(), writes);
	EXPECT_EQ(device->opens, 1);
}

TEST(FlashSession, MissingTransport)
{
	std::vector<FlashEvent> events;
	FlashSession session(nullptr, { "Application", 0x10000, "" }, testImage(100), testConfig());
	FlashEvent result = session.run(std::stop_token(), [&](const FlashEvent &event) { events.push_back(event); });

	EXPECT_EQ(result.type, FLASH_EVENT_FAILURE);
	EXPECT_EQ(result.error, FLASH_ERROR_TRANSPORT_UNAVAILABLE);
	EXPECT_EQ(session.getPhase(), FlashPhase::Failed);
	ASSERT_EQ(events.size(), 1u);
	EXPECT_EQ(events[0].type, FLASH_EVENT_FAILURE);

	FlashEvent second = session.run(std::stop_token(), [](const FlashEvent&) {});
	EXPECT_EQ(second.error, FLASH_ERROR_SESSION_REUSED);
}

TEST(FlashSync, ProbeReportsAttempts)
{
	auto device = std::make_shared<MockBootloader>();
	device->silentSyncs = 1;
	MockTransport transport(device);
	int attempts = -1;
	auto error = flash_probe(transport, testConfig(), std::stop_token(), attempts);
	ASSERT_FALSE(error) << error->msg;
	EXPECT_EQ(attempts, 2);
	EXPECT_TRUE(device->inbound.empty());
	EXPECT_FALSE(device->open);
}

TEST(FlashSync, ProbeWithoutAnswer)
{
	auto device = std::make_shared<MockBootloader>();
	device->silentSyncs = 1000;
	MockTransport transport(device);
	int attempts = -1;
	auto error = flash_probe(transport, testConfig(), std::stop_token(), attempts);
	ASSERT_FALSE(error) << error->msg;
	EXPECT_EQ(attempts, 0);
}

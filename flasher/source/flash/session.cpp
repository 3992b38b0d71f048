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

#include "session.hpp"
#include "comm/slip.hpp"

#include "util/log.hpp"
#include "util/threading.hpp"

#include <algorithm>

// Bound for single reads while waiting for a response, keeps cancellation responsive
#define RESPONSE_POLL_MS	100
// Bound for stale sync replies discarded after a successful sync
#define SYNC_DRAIN_READS	64

const char *getPhaseName(FlashPhase phase)
{
	switch (phase)
	{
		case FlashPhase::Idle: return "Idle";
		case FlashPhase::Connecting: return "Connecting";
		case FlashPhase::Syncing: return "Syncing";
		case FlashPhase::Erasing: return "Erasing";
		case FlashPhase::Writing: return "Writing";
		case FlashPhase::Finalizing: return "Finalizing";
		case FlashPhase::Done: return "Done";
		case FlashPhase::Failed: return "Failed";
	}
	return "Unknown";
}

std::optional<ErrorMessage> flash_syncBootloader(Transport &transport, const FlasherConfig &config, std::stop_token stop, int &attempts)
{
	attempts = 0;
	std::vector<uint8_t> frame = cmd_buildSync();
	uint8_t buffer[256];
	for (int i = 1; i <= config.syncAttempts; i++)
	{
		if (stop.stop_requested())
			return ErrorMessage("Cancelled while synchronising!", FLASH_ERROR_CANCELLED);
		auto error = transport.write(frame);
		if (error)
			return ErrorMessage(asprintf_s("Failed to send sync: %s", error->c_str()), FLASH_ERROR_WRITE_REJECTED);
		if (!interruptibleWait(stop, config.timing.syncDelayMS))
			return ErrorMessage("Cancelled while synchronising!", FLASH_ERROR_CANCELLED);
		// Single read per attempt, any data at all counts as an answer
		int rd = transport.read(buffer, sizeof(buffer), config.timing.syncTimeoutMS);
		if (rd > 0)
		{
			attempts = i;
			LOGBYTES(LProtocol, LTrace, "Sync answer", buffer, rd);
			break;
		}
		if (rd < 0)
			LOG(LProtocol, LWarn, "Failed to read sync answer in attempt %d/%d!", i, config.syncAttempts)
		else
			LOG(LProtocol, LDebug, "No answer to sync attempt %d/%d", i, config.syncAttempts)
	}
	if (attempts == 0)
		return std::nullopt;

	// The bootloader answers a single sync several times, drop those before sending commands
	for (int i = 0; i < SYNC_DRAIN_READS; i++)
	{
		if (stop.stop_requested())
			return ErrorMessage("Cancelled while synchronising!", FLASH_ERROR_CANCELLED);
		int rd = transport.read(buffer, sizeof(buffer), config.timing.drainTimeoutMS);
		if (rd <= 0) break;
		LOG(LProtocol, LTrace, "Discarded %d bytes of stale sync answers", rd);
	}
	return std::nullopt;
}

std::optional<ErrorMessage> flash_probe(Transport &transport, const FlasherConfig &config, std::stop_token stop, int &attempts)
{
	SerialConfig serial = {};
	serial.baudRate = config.syncBaudRate;
	auto error = transport.open(serial);
	if (error)
		return ErrorMessage(std::move(error->msg), FLASH_ERROR_TRANSPORT_UNAVAILABLE);
	error = flash_syncBootloader(transport, config, stop, attempts);
	transport.close();
	return error;
}


/**
 * Flash session
 */

FlashSession::FlashSession(std::unique_ptr<Transport> transport, FlashAddress address, std::vector<uint8_t> image, FlasherConfig config)
	: transport(std::move(transport)), address(std::move(address)), image(std::move(image)), config(config) {}

FlashSession::~FlashSession()
{
	if (transport && transport->isOpen())
		transport->close();
}

void FlashSession::emit(std::string message, bool warning, FlashErrorKind kind)
{
	if (warning)
		LOG(LFlash, LWarn, "%s", message.c_str())
	else
		LOG(LFlash, LDebug, "%s: %s", getPhaseName(phase), message.c_str())
	if (!sink || !*sink) return;
	FlashEvent event = {};
	event.type = FLASH_EVENT_STATUS;
	event.phase = phase;
	event.progress = progress;
	event.message = std::move(message);
	event.warning = warning;
	event.error = kind;
	(*sink)(event);
}

void FlashSession::enter(FlashPhase newPhase, float newProgress, std::string message)
{
	phase = newPhase;
	progress = newProgress;
	emit(std::move(message));
}

std::optional<ErrorMessage> FlashSession::checkpoint()
{
	if (stop.stop_requested())
		return ErrorMessage(asprintf_s("Flashing cancelled while %s!", getPhaseName(phase)), FLASH_ERROR_CANCELLED);
	if (config.timing.deadlineMS > 0 && dtMS(startTime, sclock::now()) > config.timing.deadlineMS)
		return ErrorMessage(asprintf_s("Flashing exceeded the deadline of %dms while %s!",
			config.timing.deadlineMS, getPhaseName(phase)), FLASH_ERROR_TIMEOUT);
	return std::nullopt;
}

std::optional<ErrorMessage> FlashSession::wait(int timeMS)
{
	if (!interruptibleWait(stop, timeMS))
		return ErrorMessage(asprintf_s("Flashing cancelled while %s!", getPhaseName(phase)), FLASH_ERROR_CANCELLED);
	return checkpoint();
}

std::optional<ErrorMessage> FlashSession::send(const std::vector<uint8_t> &frame)
{
	auto error = transport->write(frame);
	if (error)
		return ErrorMessage(std::move(error->msg), FLASH_ERROR_WRITE_REJECTED);
	return std::nullopt;
}

std::optional<ErrorMessage> FlashSession::expectResponse(uint8_t opcode, int timeoutMS)
{
	SlipReader reader;
	uint8_t buffer[256];
	TimePoint_t start = sclock::now();
	while (true)
	{
		auto error = checkpoint();
		if (error) return error;

		int64_t remaining = std::max<int64_t>(0, timeoutMS - dtMS(start, sclock::now()));
		int rd = transport->read(buffer, sizeof(buffer), (uint32_t)std::min<int64_t>(remaining, RESPONSE_POLL_MS));
		if (rd < 0)
			return ErrorMessage(asprintf_s("Failed to read response to %s!", getOpcodeName(opcode)), FLASH_ERROR_TRANSPORT_UNAVAILABLE);

		std::size_t pos = 0;
		while (pos < (std::size_t)rd)
		{
			bool complete;
			pos += reader.feed(buffer+pos, rd-pos, complete);
			if (!complete) continue;
			Response response;
			auto parseError = cmd_parseResponseFrame(reader.frame, CMD_STATUS_BYTES_AUTO, response);
			if (parseError)
			{
				LOG(LProtocol, LDebug, "Skipping invalid frame: %s", parseError->c_str());
				continue;
			}
			if (response.opcode != opcode)
			{ // Left over from an earlier command
				LOG(LProtocol, LDebug, "Skipping response to %s while waiting for %s",
					getOpcodeName(response.opcode), getOpcodeName(opcode));
				continue;
			}
			if (!response.success())
				return ErrorMessage(asprintf_s("Bootloader failed %s with status %d, error 0x%02X!",
					getOpcodeName(opcode), response.status, response.error), FLASH_ERROR_RESPONSE_MISMATCH);
			LOG(LProtocol, LTrace, "Bootloader acknowledged %s", getOpcodeName(opcode));
			return std::nullopt;
		}

		if (dtMS(start, sclock::now()) >= timeoutMS)
			break;
	}
	return ErrorMessage(asprintf_s("No response to %s within %dms!", getOpcodeName(opcode), timeoutMS), FLASH_ERROR_RESPONSE_MISMATCH);
}

std::optional<ErrorMessage> FlashSession::prepare()
{
	auto error = config_validate(config);
	if (error) return error;
	error = image_check(image, config.allowUnknownImage, chip);
	if (error) return error;
	if (chip == ChipFamily::Unknown)
		emit(asprintf_s("Unknown chip type, magic byte 0x%02X! Proceeding anyway.", image[0]), true, FLASH_ERROR_UNRECOGNIZED_IMAGE);
	return blocks_plan(image, config.blockSize, plan);
}

std::optional<ErrorMessage> FlashSession::connect()
{
	enter(FlashPhase::Connecting, 0.0f, asprintf_s("Connecting to %s at %u baud...", transport->describe().c_str(), config.syncBaudRate));
	SerialConfig serial = {};
	serial.baudRate = config.syncBaudRate;
	auto error = transport->open(serial);
	if (error)
		return ErrorMessage(std::move(error->msg), FLASH_ERROR_TRANSPORT_UNAVAILABLE);
	baudRate = config.syncBaudRate;
	progress = FLASH_PROGRESS_CONNECTED;
	emit(asprintf_s("Connected to %s. Preparing to flash %s firmware...", transport->describe().c_str(), getChipName(chip)));
	return checkpoint();
}

std::optional<ErrorMessage> FlashSession::synchronise()
{
	enter(FlashPhase::Syncing, FLASH_PROGRESS_CONNECTED, "Synchronising with bootloader...");
	int attempts = 0;
	auto error = flash_syncBootloader(*transport, config, stop, attempts);
	if (error) return error;
	synced = attempts > 0;
	if (!synced && config.strictSync)
		return ErrorMessage(asprintf_s("Bootloader did not answer %d sync attempts!", config.syncAttempts), FLASH_ERROR_SYNC_TIMEOUT);
	progress = FLASH_PROGRESS_SYNCED;
	if (synced)
		emit(asprintf_s("Bootloader answered after %d sync attempt(s)", attempts));
	else
		emit(asprintf_s("Bootloader did not answer %d sync attempts, continuing anyway", config.syncAttempts), true, FLASH_ERROR_SYNC_TIMEOUT);
	return checkpoint();
}

std::optional<ErrorMessage> FlashSession::switchBaudRate()
{
	if (config.flashBaudRate == baudRate)
		return std::nullopt;
	if (!synced)
	{
		emit(asprintf_s("Can't negotiate %u baud without bootloader answer, staying at %u baud", config.flashBaudRate, baudRate), true);
		return std::nullopt;
	}
	emit(asprintf_s("Switching to %u baud...", config.flashBaudRate));
	auto error = send(cmd_buildChangeBaud(config.flashBaudRate, 0));
	if (error) return error;
	if (config.validateResponses)
	{
		error = expectResponse(CMD_CHANGE_BAUDRATE, config.timing.responseTimeoutMS);
		if (error) return error;
	}
	error = transport->setBaudRate(config.flashBaudRate);
	if (error)
		return ErrorMessage(std::move(error->msg), FLASH_ERROR_TRANSPORT_UNAVAILABLE);
	baudRate = config.flashBaudRate;
	error = wait(config.timing.baudSettleMS);
	if (error) return error;
	transport->flushInput();
	return std::nullopt;
}

std::optional<ErrorMessage> FlashSession::erase()
{
	enter(FlashPhase::Erasing, FLASH_PROGRESS_SYNCED, asprintf_s("Erasing %u bytes at 0x%X...", plan.paddedSize(), address.offset));
	auto error = send(cmd_buildFlashBegin(plan.paddedSize(), plan.count(), plan.blockSize, address.offset));
	if (error) return error;
	if (config.validateResponses)
	{
		error = expectResponse(CMD_FLASH_BEGIN, config.timing.eraseTimeoutMS);
		if (error) return error;
	}
	return wait(config.timing.eraseSettleMS);
}

std::optional<ErrorMessage> FlashSession::writeBlocks()
{
	uint32_t total = plan.count();
	enter(FlashPhase::Writing, FLASH_PROGRESS_SYNCED, asprintf_s("Writing firmware to %s...", getChipName(chip)));
	std::vector<uint8_t> frame;
	uint32_t written = 0;
	for (FlashBlock block : plan)
	{
		auto error = checkpoint();
		if (error) return error;
		// Bootloader expects strictly consecutive blocks
		if (block.sequence != written)
			return ErrorMessage(asprintf_s("Refusing to write block %u out of order, expected block %u!", block.sequence, written), FLASH_ERROR_WRITE_REJECTED);
		error = cmd_buildFlashData(block, frame);
		if (error) return error;
		error = send(frame);
		if (error) return error;
		if (config.validateResponses)
		{
			error = expectResponse(CMD_FLASH_DATA, config.timing.responseTimeoutMS);
			if (error) return error;
		}
		error = wait(config.timing.blockDelayMS);
		if (error) return error;

		written++;
		progress = FLASH_PROGRESS_SYNCED + FLASH_PROGRESS_WRITE_BAND * written / total;
		emit(asprintf_s("Wrote block %u/%u", written, total));
	}
	return std::nullopt;
}

std::optional<ErrorMessage> FlashSession::finalize()
{
	enter(FlashPhase::Finalizing, FLASH_PROGRESS_FINALIZING, config.reboot? "Finishing and rebooting..." : "Finishing, staying in bootloader...");
	auto error = send(cmd_buildFlashEnd(config.reboot));
	if (error) return error;
	error = wait(config.timing.endSettleMS);
	if (error) return error;
	if (config.validateResponses)
	{ // Device may reset before answering, so only informational
		auto response = expectResponse(CMD_FLASH_END, 0);
		if (response)
			LOG(LProtocol, LDebug, "Flash end not confirmed: %s", response->c_str())
	}
	return std::nullopt;
}

FlashEvent FlashSession::run(std::stop_token stopToken, const FlashEventSink &eventSink)
{
	FlashEvent result = {};
	result.address = address.offset;
	result.sizeBytes = image.size();
	if (used)
	{
		result.type = FLASH_EVENT_FAILURE;
		result.phase = FlashPhase::Failed;
		result.error = FLASH_ERROR_SESSION_REUSED;
		result.message = "Flash session has already been used!";
		if (eventSink) eventSink(result);
		return result;
	}
	used = true;
	if (!transport)
	{
		LOG(LFlash, LError, "Flash session has no transport!");
		result.type = FLASH_EVENT_FAILURE;
		result.phase = phase = FlashPhase::Failed;
		result.error = FLASH_ERROR_TRANSPORT_UNAVAILABLE;
		result.message = "Flash session has no transport!";
		if (eventSink) eventSink(result);
		return result;
	}
	stop = stopToken;
	sink = &eventSink;
	startTime = sclock::now();

	auto error = prepare();
	if (!error) error = connect();
	if (!error) error = synchronise();
	if (!error) error = switchBaudRate();
	if (!error) error = erase();
	if (!error) error = writeBlocks();
	if (!error) error = finalize();

	// Always release the port, no rollback of partially written flash
	transport->close();

	if (error)
	{
		LOG(LFlash, LError, "Flashing failed while %s: %s", getPhaseName(phase), error->c_str());
		phase = FlashPhase::Failed;
		progress = 0.0f;
		result.type = FLASH_EVENT_FAILURE;
		result.error = error->kind();
		result.message = std::move(error->msg);
	}
	else
	{
		phase = FlashPhase::Done;
		progress = 1.0f;
		result.type = FLASH_EVENT_SUCCESS;
		result.message = asprintf_s("Flash successful! %s is ready.", getChipName(chip));
		LOG(LFlash, LInfo, "Flashed %u bytes at 0x%X", result.sizeBytes, result.address);
	}
	result.phase = phase;
	result.progress = progress;
	result.chip = chip;
	if (eventSink) eventSink(result);
	sink = nullptr;
	return result;
}

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

#ifndef SESSION_H
#define SESSION_H

#include "flash/address.hpp"
#include "flash/image.hpp"
#include "flash/blocks.hpp"
#include "protocol/command.hpp"
#include "comm/transport.hpp"
#include "config.hpp"

#include "util/util.hpp"
#include "util/error.hpp"

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <stop_token>

#define FLASH_PROGRESS_CONNECTED	0.05f
#define FLASH_PROGRESS_SYNCED		0.1f
#define FLASH_PROGRESS_WRITE_BAND	0.8f
#define FLASH_PROGRESS_FINALIZING	0.95f

enum class FlashPhase : uint8_t
{
	Idle,
	Connecting,
	Syncing,
	Erasing,
	Writing,
	Finalizing,
	Done,
	Failed
};

const char *getPhaseName(FlashPhase phase);

enum FlashEventType : uint8_t
{
	FLASH_EVENT_STATUS,
	FLASH_EVENT_SUCCESS,
	FLASH_EVENT_FAILURE
};

struct FlashEvent
{
	FlashEventType type = FLASH_EVENT_STATUS;
	FlashPhase phase = FlashPhase::Idle;
	float progress = 0.0f;
	std::string message;
	bool warning = false;
	FlashErrorKind error = FLASH_ERROR_NONE; // Failure kind, or the non-fatal kind of a warning
	// Final record only
	uint32_t address = 0;
	uint32_t sizeBytes = 0;
	ChipFamily chip = ChipFamily::Unknown;
};

typedef std::function<void(const FlashEvent&)> FlashEventSink;

/**
 * Single-use flash operation driving the ROM bootloader through all phases
 * Owns the transport exclusively and closes it when done, successful or not
 * Progress is only communicated through the event sink
 */
class FlashSession
{
public:
	FlashSession(std::unique_ptr<Transport> transport, FlashAddress address, std::vector<uint8_t> image, FlasherConfig config);
	~FlashSession();

	FlashSession(const FlashSession&) = delete;
	FlashSession& operator=(const FlashSession&) = delete;

	/**
	 * Run all phases sequentially on the calling thread
	 * Every event, including the final success or failure record, is passed to sink
	 * Returns the final record
	 */
	FlashEvent run(std::stop_token stop, const FlashEventSink &sink);

	FlashPhase getPhase() const { return phase; }
	float getProgress() const { return progress; }
	bool isSynced() const { return synced; }
	ChipFamily getChip() const { return chip; }

private:
	std::unique_ptr<Transport> transport;
	FlashAddress address;
	std::vector<uint8_t> image;
	FlasherConfig config;
	ChipFamily chip = ChipFamily::Unknown;
	BlockPlan plan;

	FlashPhase phase = FlashPhase::Idle;
	float progress = 0.0f;
	bool used = false;
	bool synced = false;
	uint32_t baudRate = 0;

	std::stop_token stop;
	const FlashEventSink *sink = nullptr;
	TimePoint_t startTime;

	void enter(FlashPhase phase, float progress, std::string message);
	void emit(std::string message, bool warning = false, FlashErrorKind kind = FLASH_ERROR_NONE);

	HANDLE_ERROR checkpoint();
	HANDLE_ERROR wait(int timeMS);
	HANDLE_ERROR send(const std::vector<uint8_t> &frame);
	HANDLE_ERROR expectResponse(uint8_t opcode, int timeoutMS);

	HANDLE_ERROR prepare();
	HANDLE_ERROR connect();
	HANDLE_ERROR synchronise();
	HANDLE_ERROR switchBaudRate();
	HANDLE_ERROR erase();
	HANDLE_ERROR writeBlocks();
	HANDLE_ERROR finalize();
};

/**
 * Repeatedly send sync until any data is received or the attempts are exhausted
 * attempts is set to the number of attempts needed, or 0 if the bootloader never answered
 * Only fails if writing fails or a stop is requested
 */
HANDLE_ERROR flash_syncBootloader(Transport &transport, const FlasherConfig &config, std::stop_token stop, int &attempts);

/**
 * Open the transport at the sync baud rate, check whether a bootloader answers and close it again
 */
HANDLE_ERROR flash_probe(Transport &transport, const FlasherConfig &config, std::stop_token stop, int &attempts);

#endif // SESSION_H

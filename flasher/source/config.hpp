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

#ifndef CONFIG_H
#define CONFIG_H

#include "util/error.hpp"

#include <string>
#include <cstdint>

/**
 * Flasher configuration, defaults match the ROM bootloader reference behaviour
 */

// Fixed waits where the bootloader gives no acknowledgement to wait for
struct FlashTiming
{
	int syncDelayMS = 100;		// After each sync attempt before reading
	int syncTimeoutMS = 100;	// Wait for inbound data per sync attempt
	int drainTimeoutMS = 50;	// Quiet period that ends draining of stale sync replies
	int baudSettleMS = 50;		// After switching baud rate
	int eraseSettleMS = 100;	// After flash begin
	int blockDelayMS = 5;		// After each data block
	int endSettleMS = 1000;		// After flash end, before closing
	int responseTimeoutMS = 3000;	// Wait for a command response when validating
	int eraseTimeoutMS = 10000;	// Wait for the flash begin response, erasing takes a while
	int deadlineMS = 0;			// Overall session deadline, 0 for none
};

struct FlasherConfig
{
	uint32_t syncBaudRate = 115200;
	uint32_t flashBaudRate = 115200;
	uint32_t blockSize = 1024;
	int syncAttempts = 10;
	bool strictSync = false;		// Abort if the bootloader never answers sync
	bool validateResponses = true;	// Parse and check responses to flash begin and data
	bool allowUnknownImage = false;	// Flash images with unrecognised magic byte
	bool reboot = true;				// Reboot into the application after flashing
	FlashTiming timing = {};
};

HANDLE_ERROR config_validate(const FlasherConfig &config);

/**
 * Read config from a JSON file, keys that are not present keep their current value
 */
HANDLE_ERROR parseFlasherConfigFile(const std::string &path, FlasherConfig &config);

HANDLE_ERROR parseFlasherConfig(const std::string &text, FlasherConfig &config);

#endif // CONFIG_H

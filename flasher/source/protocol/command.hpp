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

#ifndef COMMAND_H
#define COMMAND_H

#include "util/error.hpp"

#include <vector>
#include <cstdint>
#include <cstddef>

/**
 * ROM bootloader command packets
 * Header: direction (1), opcode (1), payload length (2, LE), checksum or value (4, LE)
 * Followed by the payload, the whole packet SLIP framed on the wire
 */

#define CMD_HEADER_SIZE				8
#define CMD_MAX_PAYLOAD				0xFFFF
#define CMD_FLASH_DATA_HEADER		16
#define CMD_SYNC_MAGIC_SIZE			4
#define CMD_SYNC_FILLER_SIZE		32
#define CMD_SYNC_FILLER				0x55
// Status width of ESP8266 and ESP32 ROM loaders
#define CMD_STATUS_BYTES_SHORT		2
#define CMD_STATUS_BYTES_LONG		4
// Take the status width from the response itself
#define CMD_STATUS_BYTES_AUTO		0

enum CommandDirection : uint8_t
{
	CMD_DIR_REQUEST = 0x00,
	CMD_DIR_RESPONSE = 0x01
};

enum CommandOpcode : uint8_t
{
	CMD_FLASH_BEGIN = 0x02,
	CMD_FLASH_DATA = 0x03,
	CMD_FLASH_END = 0x04,
	CMD_SYNC = 0x08,
	CMD_CHANGE_BAUDRATE = 0x0F,
};

enum FlashEndAction : uint8_t
{
	FLASH_END_REBOOT = 0,
	FLASH_END_STAY = 1
};

struct Packet
{
	CommandDirection direction;
	uint8_t opcode;
	std::vector<uint8_t> payload;
	uint32_t checksum; // Value field in responses
};

struct Response
{
	uint8_t opcode;
	uint32_t value;
	std::vector<uint8_t> payload; // Without trailing status bytes
	uint8_t status;
	uint8_t error;

	inline bool success() const { return status == 0; }
};

struct FlashBlock; // flash/blocks.hpp

const char *getOpcodeName(uint8_t opcode);

/**
 * Serialise a request with its header and frame it
 * Fails if the payload does not fit the 16-bit length field
 */
HANDLE_ERROR cmd_build(uint8_t opcode, const std::vector<uint8_t> &payload, uint32_t checksum, std::vector<uint8_t> &framed);

std::vector<uint8_t> cmd_buildSync();
std::vector<uint8_t> cmd_buildFlashBegin(uint32_t eraseSize, uint32_t blockCount, uint32_t blockSize, uint32_t offset);
HANDLE_ERROR cmd_buildFlashData(const FlashBlock &block, std::vector<uint8_t> &framed);
std::vector<uint8_t> cmd_buildFlashEnd(bool reboot);
std::vector<uint8_t> cmd_buildChangeBaud(uint32_t newBaud, uint32_t oldBaud);

/**
 * Parse an unframed packet of either direction
 */
HANDLE_ERROR cmd_parsePacket(const std::vector<uint8_t> &unframed, Packet &packet);

/**
 * Parse a response from the SLIP decoded frame contents
 * statusBytes is the number of trailing payload bytes carrying status (first) and error (second)
 * With CMD_STATUS_BYTES_AUTO, a 2-byte payload is all status, anything longer ends in 4 status bytes
 */
HANDLE_ERROR cmd_parseResponseFrame(const std::vector<uint8_t> &unframed, int statusBytes, Response &response);

/**
 * Parse a response as received on the wire, including SLIP framing
 */
HANDLE_ERROR cmd_parseResponse(const std::vector<uint8_t> &framed, int statusBytes, Response &response);

#endif // COMMAND_H

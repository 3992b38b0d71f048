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

#include "command.hpp"
#include "flash/blocks.hpp"

#include "comm/slip.hpp"
#include "hash/checksum.hpp"
#include "util/util.hpp"
#include "util/log.hpp"

#include <cstring>
#include <algorithm>

const char *getOpcodeName(uint8_t opcode)
{
	switch (opcode)
	{
		case CMD_FLASH_BEGIN: return "FLASH_BEGIN";
		case CMD_FLASH_DATA: return "FLASH_DATA";
		case CMD_FLASH_END: return "FLASH_END";
		case CMD_SYNC: return "SYNC";
		case CMD_CHANGE_BAUDRATE: return "CHANGE_BAUDRATE";
		default: return "UNKNOWN";
	}
}

// Caller guarantees payload fits into the length field
static std::vector<uint8_t> cmd_frame(uint8_t opcode, const uint8_t *payload, uint16_t length, uint32_t checksum)
{
	std::vector<uint8_t> packet(CMD_HEADER_SIZE + length);
	packet[0] = CMD_DIR_REQUEST;
	packet[1] = opcode;
	writeLE16(packet.data()+2, length);
	writeLE32(packet.data()+4, checksum);
	if (length > 0)
		memcpy(packet.data()+CMD_HEADER_SIZE, payload, length);
	LOGBYTES(LProtocol, LTrace, getOpcodeName(opcode), packet.data(), std::min<std::size_t>(packet.size(), 64));
	return slip_encode(packet);
}

std::optional<ErrorMessage> cmd_build(uint8_t opcode, const std::vector<uint8_t> &payload, uint32_t checksum, std::vector<uint8_t> &framed)
{
	if (payload.size() > CMD_MAX_PAYLOAD)
		return ErrorMessage(asprintf_s("Payload of %d bytes for command %s exceeds maximum size!",
			(int)payload.size(), getOpcodeName(opcode)), FLASH_ERROR_INVALID_CONFIG);
	framed = cmd_frame(opcode, payload.data(), payload.size(), checksum);
	return std::nullopt;
}

std::vector<uint8_t> cmd_buildSync()
{
	uint8_t payload[CMD_SYNC_MAGIC_SIZE + CMD_SYNC_FILLER_SIZE];
	payload[0] = 0x07;
	payload[1] = 0x07;
	payload[2] = 0x12;
	payload[3] = 0x20;
	memset(payload+CMD_SYNC_MAGIC_SIZE, CMD_SYNC_FILLER, CMD_SYNC_FILLER_SIZE);
	return cmd_frame(CMD_SYNC, payload, sizeof(payload), 0);
}

std::vector<uint8_t> cmd_buildFlashBegin(uint32_t eraseSize, uint32_t blockCount, uint32_t blockSize, uint32_t offset)
{
	uint8_t payload[16];
	writeLE32(payload+0, eraseSize);
	writeLE32(payload+4, blockCount);
	writeLE32(payload+8, blockSize);
	writeLE32(payload+12, offset);
	return cmd_frame(CMD_FLASH_BEGIN, payload, sizeof(payload), 0);
}

std::optional<ErrorMessage> cmd_buildFlashData(const FlashBlock &block, std::vector<uint8_t> &framed)
{
	std::vector<uint8_t> payload(CMD_FLASH_DATA_HEADER + block.data.size(), 0);
	writeLE32(payload.data()+0, block.data.size());
	writeLE32(payload.data()+4, block.sequence);
	// 8 reserved bytes stay zero
	memcpy(payload.data()+CMD_FLASH_DATA_HEADER, block.data.data(), block.data.size());
	uint8_t checksum = flash_checksum(block.data.data(), block.data.size());
	return cmd_build(CMD_FLASH_DATA, payload, checksum, framed);
}

std::vector<uint8_t> cmd_buildFlashEnd(bool reboot)
{
	uint8_t payload[4] = { 0, 0, 0, 0 };
	payload[0] = reboot? FLASH_END_REBOOT : FLASH_END_STAY;
	return cmd_frame(CMD_FLASH_END, payload, sizeof(payload), 0);
}

std::vector<uint8_t> cmd_buildChangeBaud(uint32_t newBaud, uint32_t oldBaud)
{
	uint8_t payload[8];
	writeLE32(payload+0, newBaud);
	writeLE32(payload+4, oldBaud); // 0 when talking to the ROM loader
	return cmd_frame(CMD_CHANGE_BAUDRATE, payload, sizeof(payload), 0);
}

std::optional<ErrorMessage> cmd_parsePacket(const std::vector<uint8_t> &unframed, Packet &packet)
{
	if (unframed.size() < CMD_HEADER_SIZE)
		return ErrorMessage(asprintf_s("Packet of %d bytes is too short for a header!", (int)unframed.size()), FLASH_ERROR_RESPONSE_MISMATCH);
	if (unframed[0] != CMD_DIR_REQUEST && unframed[0] != CMD_DIR_RESPONSE)
		return ErrorMessage(asprintf_s("Packet has invalid direction %x!", unframed[0]), FLASH_ERROR_RESPONSE_MISMATCH);
	uint16_t length = readLE16(unframed.data()+2);
	if (unframed.size() < CMD_HEADER_SIZE + length)
		return ErrorMessage(asprintf_s("Packet declares %d payload bytes but only has %d!",
			length, (int)(unframed.size() - CMD_HEADER_SIZE)), FLASH_ERROR_RESPONSE_MISMATCH);
	packet.direction = (CommandDirection)unframed[0];
	packet.opcode = unframed[1];
	packet.checksum = readLE32(unframed.data()+4);
	packet.payload.assign(unframed.begin()+CMD_HEADER_SIZE, unframed.begin()+CMD_HEADER_SIZE+length);
	return std::nullopt;
}

std::optional<ErrorMessage> cmd_parseResponseFrame(const std::vector<uint8_t> &unframed, int statusBytes, Response &response)
{
	Packet packet;
	auto error = cmd_parsePacket(unframed, packet);
	if (error) return error;
	if (packet.direction != CMD_DIR_RESPONSE)
		return ErrorMessage(asprintf_s("Expected response but received request for %s!", getOpcodeName(packet.opcode)), FLASH_ERROR_RESPONSE_MISMATCH);
	if (statusBytes == CMD_STATUS_BYTES_AUTO)
	{ // Replies to commands without result data only carry the status
		statusBytes = packet.payload.size() == CMD_STATUS_BYTES_SHORT? CMD_STATUS_BYTES_SHORT : CMD_STATUS_BYTES_LONG;
	}
	if (statusBytes < CMD_STATUS_BYTES_SHORT || packet.payload.size() < (std::size_t)statusBytes)
		return ErrorMessage(asprintf_s("Response to %s has %d payload bytes, too short for %d status bytes!",
			getOpcodeName(packet.opcode), (int)packet.payload.size(), statusBytes), FLASH_ERROR_RESPONSE_MISMATCH);
	std::size_t dataSize = packet.payload.size() - statusBytes;
	response.opcode = packet.opcode;
	response.value = packet.checksum;
	response.status = packet.payload[dataSize];
	response.error = packet.payload[dataSize+1];
	packet.payload.resize(dataSize);
	response.payload = std::move(packet.payload);
	return std::nullopt;
}

std::optional<ErrorMessage> cmd_parseResponse(const std::vector<uint8_t> &framed, int statusBytes, Response &response)
{
	return cmd_parseResponseFrame(slip_decode(framed), statusBytes, response);
}

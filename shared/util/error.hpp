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

#ifndef ERROR_H
#define ERROR_H

#include <string>
#include <optional>


/* Error Handling */

enum FlashErrorKind : int
{
	FLASH_ERROR_NONE = 0,
	FLASH_ERROR_TRANSPORT_UNAVAILABLE,	// Transport failed to open or configure
	FLASH_ERROR_WRITE_REJECTED,			// Transport write failed mid-session
	FLASH_ERROR_SYNC_TIMEOUT,			// No bootloader answer to sync, fatal only with strict sync
	FLASH_ERROR_INVALID_ADDRESS,		// Custom offset failed to parse or unknown region
	FLASH_ERROR_EMPTY_IMAGE,
	FLASH_ERROR_UNRECOGNIZED_IMAGE,
	FLASH_ERROR_RESPONSE_MISMATCH,		// Bootloader response missing, malformed or reported failure
	FLASH_ERROR_CANCELLED,
	FLASH_ERROR_TIMEOUT,				// Overall session deadline expired
	FLASH_ERROR_INVALID_CONFIG,
	FLASH_ERROR_SESSION_REUSED,
	FLASH_ERROR_MAX
};

const char *getErrorKindName(int kind);

struct [[nodiscard]] ErrorMessage
{
	std::string msg;
	int code;

	inline ErrorMessage(std::string &&msg) noexcept : msg(std::move(msg)), code(-1) {}
	inline ErrorMessage(const char *msg) noexcept : msg(msg), code(-1) {}
	inline ErrorMessage(std::string &&msg, int code) noexcept : msg(std::move(msg)), code(code) {}
	inline ErrorMessage(const char *msg, int code) noexcept : msg(msg), code(code) {}

	inline const std::string& str() const noexcept { return msg; }
	inline const char* c_str() const noexcept { return msg.c_str(); }
	inline FlashErrorKind kind() const noexcept
	{
		if (code <= FLASH_ERROR_NONE || code >= FLASH_ERROR_MAX) return FLASH_ERROR_NONE;
		return (FlashErrorKind)code;
	}
};

#define HANDLE_ERROR [[nodiscard]] std::optional<ErrorMessage>

#endif // ERROR_H

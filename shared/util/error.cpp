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

#include "error.hpp"

const char *getErrorKindName(int kind)
{
	switch (kind)
	{
		case FLASH_ERROR_NONE: return "None";
		case FLASH_ERROR_TRANSPORT_UNAVAILABLE: return "TransportUnavailable";
		case FLASH_ERROR_WRITE_REJECTED: return "WriteRejected";
		case FLASH_ERROR_SYNC_TIMEOUT: return "SyncTimeout";
		case FLASH_ERROR_INVALID_ADDRESS: return "InvalidAddress";
		case FLASH_ERROR_EMPTY_IMAGE: return "EmptyImage";
		case FLASH_ERROR_UNRECOGNIZED_IMAGE: return "UnrecognizedImage";
		case FLASH_ERROR_RESPONSE_MISMATCH: return "ResponseMismatch";
		case FLASH_ERROR_CANCELLED: return "Cancelled";
		case FLASH_ERROR_TIMEOUT: return "Timeout";
		case FLASH_ERROR_INVALID_CONFIG: return "InvalidConfig";
		case FLASH_ERROR_SESSION_REUSED: return "SessionReused";
		default: return "Unknown";
	}
}

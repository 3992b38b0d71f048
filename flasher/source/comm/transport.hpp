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

#ifndef TRANSPORT_H
#define TRANSPORT_H

#include "util/error.hpp"

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>
#include <cstddef>

#define SERIAL_BAUD_RATE_SYNC	115200

enum SerialParity : uint8_t
{
	PARITY_NONE,
	PARITY_EVEN,
	PARITY_ODD
};

struct SerialConfig
{
	uint32_t baudRate = SERIAL_BAUD_RATE_SYNC;
	uint8_t dataBits = 8;
	uint8_t stopBits = 1;
	SerialParity parity = PARITY_NONE;
};

/**
 * Byte stream to the bootloader, exclusively owned by one flash session
 */
class Transport
{
public:
	virtual ~Transport() = default;

	[[nodiscard]] virtual std::optional<ErrorMessage> open(const SerialConfig &config) = 0;
	virtual void close() = 0;
	virtual bool isOpen() const = 0;

	/**
	 * Writes all bytes or fails
	 */
	[[nodiscard]] virtual std::optional<ErrorMessage> write(const uint8_t *data, std::size_t length) = 0;

	/**
	 * Waits up to timeoutMS for inbound data and reads what is available
	 * Returns the number of bytes read, 0 on timeout, negative on error
	 */
	virtual int read(uint8_t *buffer, std::size_t maxBytes, uint32_t timeoutMS) = 0;

	/**
	 * Discard any inbound data that has not been read yet
	 */
	virtual void flushInput() = 0;

	[[nodiscard]] virtual std::optional<ErrorMessage> setBaudRate(uint32_t baudRate) = 0;

	virtual std::string describe() const = 0;

	[[nodiscard]] inline std::optional<ErrorMessage> write(const std::vector<uint8_t> &data)
	{
		return write(data.data(), data.size());
	}
};

typedef std::function<std::unique_ptr<Transport>(const std::string &id)> TransportFactory;

#endif // TRANSPORT_H

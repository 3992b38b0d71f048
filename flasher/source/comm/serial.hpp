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

#ifndef SERIAL_H
#define SERIAL_H

#include "transport.hpp"

#include <string>
#include <vector>

/**
 * Linux serial port using termios2, allowing arbitrary baud rates
 */
class SerialTransport : public Transport
{
public:
	SerialTransport(std::string port) : port(std::move(port)) {}
	~SerialTransport() override;

	HANDLE_ERROR open(const SerialConfig &config) override;
	void close() override;
	bool isOpen() const override { return fd >= 0; }

	HANDLE_ERROR write(const uint8_t *data, std::size_t length) override;
	int read(uint8_t *buffer, std::size_t maxBytes, uint32_t timeoutMS) override;
	void flushInput() override;
	HANDLE_ERROR setBaudRate(uint32_t baudRate) override;

	std::string describe() const override { return port; }

	using Transport::write;

private:
	std::string port;
	SerialConfig config;
	int fd = -1;
};

std::unique_ptr<Transport> serial_create(const std::string &port);

/**
 * List serial device nodes that may host a USB-UART bridge
 */
std::vector<std::string> serial_listPorts();

#endif // SERIAL_H

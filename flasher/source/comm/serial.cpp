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

#include "serial.hpp"
#include "util/util.hpp"
#include "util/log.hpp"

//#include <asm/termios.h> // Clashes with ioctl.h
#include <asm/termbits.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <fcntl.h> // Contains file controls like O_RDWR
#include <errno.h> // Error integer and strerror() function
#include <unistd.h>
#include <cstring>

#include <filesystem>
#include <algorithm>

// Set the properties needed for the UART port
static bool configSerialPort(int uartFD, const SerialConfig &config)
{
	struct termios2 tty = {};

	if (config.parity == PARITY_NONE)
		tty.c_cflag &= ~PARENB; // Clear parity bit, disabling parity
	else
	{
		tty.c_cflag |= PARENB; // Set parity bit, enabling parity checks
		if (config.parity == PARITY_ODD)
			tty.c_cflag |= PARODD;
	}
	if (config.stopBits == 2)
		tty.c_cflag |= CSTOPB; // Two stop bits
	else
		tty.c_cflag &= ~CSTOPB; // Clear stop bit, only one stop bit used in communication
	tty.c_cflag &= ~CSIZE;
	switch (config.dataBits)
	{
		case 5: tty.c_cflag |= CS5; break;
		case 6: tty.c_cflag |= CS6; break;
		case 7: tty.c_cflag |= CS7; break;
		default: tty.c_cflag |= CS8; break; // 8 bits per byte
	}
	tty.c_cflag &= ~CRTSCTS; // Disable RTS/CTS hardware flow control
	tty.c_cflag |= CREAD | CLOCAL; // Turn on READ & ignore ctrl lines (CLOCAL = 1)

	tty.c_lflag &= ~ICANON; // Disable canonical mode, where data is read line by line
	tty.c_lflag &= ~ECHO; // Disable echo
	tty.c_lflag &= ~ECHOE; // Disable erasure
	tty.c_lflag &= ~ECHONL; // Disable new-line echo
	tty.c_lflag &= ~ISIG; // Disable interpretation of INTR, QUIT and SUSP

	tty.c_iflag &= ~(IXON | IXOFF | IXANY); // Turn off s/w flow ctrl
	tty.c_iflag &= ~(IGNBRK|BRKINT|IGNPAR|PARMRK|ISTRIP|INLCR|IGNCR|ICRNL); // Disable any special handling of received bytes

	tty.c_oflag &= ~OPOST; // Prevent special interpretation of output bytes (e.g. newline chars)
	tty.c_oflag &= ~ONLCR; // Prevent conversion of newline to carriage return/line feed

	// Completely non-blocking, waiting is done with select
	tty.c_cc[VTIME] = 0;
	tty.c_cc[VMIN] = 0;

	tty.c_cflag &= ~CBAUD; // Unset current baud rate
	tty.c_cflag |= BOTHER; // Allow custom baud rate
	tty.c_ispeed = config.baudRate; // Set custom input baud
	tty.c_ospeed = config.baudRate; // Set custom output baud

	return ioctl(uartFD, TCSETSF2, &tty) == 0;
}

SerialTransport::~SerialTransport()
{
	close();
}

std::optional<ErrorMessage> SerialTransport::open(const SerialConfig &cfg)
{
	if (fd >= 0) close();
	config = cfg;
	fd = ::open(port.c_str(), O_RDWR | O_NOCTTY);
	if (fd < 0)
		return ErrorMessage(asprintf_s("Can't open serial port %s! (%i: %s)", port.c_str(), errno, strerror(errno)), FLASH_ERROR_TRANSPORT_UNAVAILABLE);
	if (!configSerialPort(fd, config))
	{
		int err = errno;
		::close(fd);
		fd = -1;
		return ErrorMessage(asprintf_s("Can't configure serial port %s for %u baud! (%i: %s)", port.c_str(), config.baudRate, err, strerror(err)), FLASH_ERROR_TRANSPORT_UNAVAILABLE);
	}
	LOG(LSerial, LDebug, "Opened serial port %s at %u baud", port.c_str(), config.baudRate);
	return std::nullopt;
}

void SerialTransport::close()
{
	if (fd < 0) return;
	::close(fd);
	fd = -1;
	LOG(LSerial, LDebug, "Closed serial port %s", port.c_str());
}

std::optional<ErrorMessage> SerialTransport::write(const uint8_t *data, std::size_t length)
{
	if (fd < 0)
		return ErrorMessage(asprintf_s("Serial port %s is not open!", port.c_str()), FLASH_ERROR_WRITE_REJECTED);
	std::size_t written = 0;
	while (written < length)
	{
		ssize_t wr = ::write(fd, data+written, length-written);
		if (wr < 0)
		{
			if (errno == EINTR || errno == EAGAIN) continue;
			return ErrorMessage(asprintf_s("Failed to write to serial port %s! (%i: %s)", port.c_str(), errno, strerror(errno)), FLASH_ERROR_WRITE_REJECTED);
		}
		written += wr;
	}
	// Wait for the data to be sent out
	ioctl(fd, TCSBRK, 1);
	return std::nullopt;
}

int SerialTransport::read(uint8_t *buffer, std::size_t maxBytes, uint32_t timeoutMS)
{
	if (fd < 0) return -1;
	struct timeval timeout;
	timeout.tv_sec = timeoutMS / 1000;
	timeout.tv_usec = (timeoutMS % 1000) * 1000;

	fd_set readFD;
	FD_ZERO(&readFD);
	FD_SET(fd, &readFD);

	int status = select(fd + 1, &readFD, nullptr, nullptr, &timeout);
	if (status < 0)
	{
		if (errno == EINTR) return 0;
		LOG(LSerial, LWarn, "Failed to wait on serial port %s! (%i: %s)", port.c_str(), errno, strerror(errno));
		return status;
	}
	if (!FD_ISSET(fd, &readFD)) return 0;
	int rd = ::read(fd, buffer, maxBytes);
	if (rd < 0 && (errno == EINTR || errno == EAGAIN)) return 0;
	return rd;
}

void SerialTransport::flushInput()
{
	if (fd < 0) return;
	ioctl(fd, TCFLSH, TCIFLUSH);
}

std::optional<ErrorMessage> SerialTransport::setBaudRate(uint32_t baudRate)
{
	config.baudRate = baudRate;
	if (fd < 0) return std::nullopt;
	if (!configSerialPort(fd, config))
		return ErrorMessage(asprintf_s("Can't switch serial port %s to %u baud! (%i: %s)", port.c_str(), baudRate, errno, strerror(errno)), FLASH_ERROR_TRANSPORT_UNAVAILABLE);
	LOG(LSerial, LDebug, "Switched serial port %s to %u baud", port.c_str(), baudRate);
	return std::nullopt;
}

std::unique_ptr<Transport> serial_create(const std::string &port)
{
	return std::make_unique<SerialTransport>(port);
}

std::vector<std::string> serial_listPorts()
{
	std::vector<std::string> ports;
	std::error_code ec;
	for (const auto &entry : std::filesystem::directory_iterator("/dev", ec))
	{
		std::string name = entry.path().filename().string();
		if (name.rfind("ttyUSB", 0) == 0 || name.rfind("ttyACM", 0) == 0)
			ports.push_back(entry.path().string());
	}
	std::sort(ports.begin(), ports.end());
	return ports;
}

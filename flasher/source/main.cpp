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

#include "options.hpp"
#include "config.hpp"
#include "comm/serial.hpp"
#include "flash/address.hpp"
#include "flash/image.hpp"
#include "flash/operation.hpp"

#include "util/log.hpp"
#include "util/util.hpp"

#include <signal.h>
#include <csignal>

#define EXIT_FLASH_FAILED	1
#define EXIT_USAGE			2

static volatile std::sig_atomic_t interrupted = 0;

static void interrupt_handler(int signal)
{
	interrupted = 1;
}

static int listPorts()
{
	auto ports = serial_listPorts();
	if (ports.empty())
		printf("No serial ports found.\n");
	for (const auto &port : ports)
		printf("%s\n", port.c_str());
	return 0;
}

static int listAddresses()
{
	for (const auto &address : address_catalog())
	{
		if (address.name == FLASH_ADDRESS_CUSTOM)
			printf("  %-16s  %-10s  %s\n", address.name.c_str(), "-o <hex>", address.description.c_str());
		else
			printf("  %-16s  0x%08X  %s\n", address.name.c_str(), address.offset, address.description.c_str());
	}
	return 0;
}

static int detectBootloader(const std::string &port, const std::string &file, const FlasherConfig &config)
{
	if (!file.empty())
	{
		std::vector<uint8_t> image;
		auto error = image_load(file, image);
		if (error)
			LOG(LDefault, LWarn, "%s", error->c_str())
		else
			printf("Firmware %s is built for %s.\n", file.c_str(), getChipName(image_detectChip(image)));
	}

	SerialTransport transport(port);
	int attempts = 0;
	auto error = flash_probe(transport, config, std::stop_token(), attempts);
	if (error)
	{
		LOG(LDefault, LError, "Failed to probe %s: %s", port.c_str(), error->c_str());
		return EXIT_FLASH_FAILED;
	}
	if (attempts == 0)
	{
		printf("No bootloader answered on %s. Hold BOOT while resetting the device.\n", port.c_str());
		return EXIT_FLASH_FAILED;
	}
	printf("Bootloader answered on %s after %d sync attempt(s).\n", port.c_str(), attempts);
	return 0;
}

int main(int argc, char **argv)
{
	FlasherOptions options;
	if (!options_read(options, argc, argv))
		return options.help? 0 : EXIT_USAGE;

	if (options.trace)
		SetLogLevel(LTrace);
	else if (options.verbose)
		SetLogLevel(LDebug);

	if (options.listPorts)
		return listPorts();
	if (options.listAddresses)
		return listAddresses();

	// ---- Configuration ----

	FlasherConfig config;
	if (!options.configFile.empty())
	{
		auto error = parseFlasherConfigFile(options.configFile, config);
		if (error)
		{
			LOG(LConfig, LError, "%s", error->c_str());
			return EXIT_USAGE;
		}
	}
	if (options.baudRate)
		config.flashBaudRate = options.baudRate;
	if (options.stay)
		config.reboot = false;
	if (options.allowUnknown)
		config.allowUnknownImage = true;
	if (options.strictSync)
		config.strictSync = true;
	auto error = config_validate(config);
	if (error)
	{
		LOG(LConfig, LError, "%s", error->c_str());
		return EXIT_USAGE;
	}

	if (options.port.empty())
	{
		auto ports = serial_listPorts();
		if (ports.empty())
		{
			LOG(LSerial, LError, "No serial port given and none detected!");
			return EXIT_USAGE;
		}
		options.port = ports.front();
		LOG(LSerial, LInfo, "Using detected serial port %s", options.port.c_str());
	}

	if (options.detect)
		return detectBootloader(options.port, options.file, config);

	// ---- Firmware ----

	FlashAddress address;
	error = address_resolve(options.address, options.offset, address);
	if (error)
	{
		LOG(LDefault, LError, "%s", error->c_str());
		return EXIT_USAGE;
	}
	std::vector<uint8_t> firmware;
	error = image_load(options.file, firmware);
	if (error)
	{
		LOG(LDefault, LError, "%s", error->c_str());
		return EXIT_FLASH_FAILED;
	}
	printf("Flashing %s (%d bytes) to %s at 0x%X on %s\n", options.file.c_str(), (int)firmware.size(),
		address.name.c_str(), address.offset, options.port.c_str());

	// ---- Flashing ----

	struct sigaction action = {};
	action.sa_handler = interrupt_handler;
	sigemptyset(&action.sa_mask);
	sigaction(SIGINT, &action, NULL);
	sigaction(SIGTERM, &action, NULL);

	auto operation = startFlash(serial_create, options.port, std::move(firmware), address, config);
	bool cancelled = false;
	while (true)
	{
		if (interrupted && !cancelled)
		{
			printf("Cancelling...\n");
			operation->cancel();
			cancelled = true;
		}
		FlashEvent event;
		if (operation->next(event, 100))
		{
			if (event.type == FLASH_EVENT_STATUS)
				printf("[%3d%%] %-10s %s\n", (int)(event.progress*100+0.5f), getPhaseName(event.phase), event.message.c_str());
		}
		else if (operation->finished())
			break;
	}

	FlashEvent result = operation->wait();
	if (result.type != FLASH_EVENT_SUCCESS)
	{
		printf("Flashing failed (%s): %s\n", getErrorKindName(result.error), result.message.c_str());
		return EXIT_FLASH_FAILED;
	}
	printf("[100%%] %s Wrote %u bytes at 0x%X.\n", result.message.c_str(), result.sizeBytes, result.address);
	return 0;
}

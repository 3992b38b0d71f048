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

#ifndef OPTIONS_H
#define OPTIONS_H

#include <getopt.h>
#include <unistd.h>
#include <string>
#include <cstdio>
#include <cstring>
#include <cstdint>

struct FlasherOptions
{
	std::string port;
	std::string file;
	std::string address = "Application";
	std::string offset;
	std::string configFile;
	uint32_t baudRate = 0; // Flash baud rate override, 0 to keep config
	bool detect = false;
	bool listPorts = false;
	bool listAddresses = false;
	bool stay = false;
	bool allowUnknown = false;
	bool strictSync = false;
	bool verbose = false;
	bool trace = false;
	bool help = false;
};

static void options_printHelp(const char *progname)
{
	printf(
"Usage: %s [options]\n"
"  options:\n"
"    -h, --help                 Display this help message\n"
"    -p, --port dev             Serial port of the USB-UART bridge (first detected port)\n"
"    -f, --file path            Firmware image to flash\n"
"    -a, --address name         Named flash region to write to (Application)\n"
"    -o, --offset hex           Raw flash offset in hex, implies the Custom region\n"
"    -b, --baud rate            Baud rate used for flashing after sync (115200)\n"
"    -c, --config path          JSON config file with serial, protocol and timing settings\n"
"    --detect                   Only check whether a bootloader answers on the port\n"
"    --list                     List serial ports that may host a bootloader\n"
"    --list-addresses           List the named flash regions\n"
"    --stay                     Stay in the bootloader after flashing instead of rebooting\n"
"    --allow-unknown            Flash images with an unrecognised magic byte\n"
"    --strict-sync              Abort if the bootloader does not answer sync\n"
"    -v, --verbose              Print debug logs\n"
"    --trace                    Print trace logs including hex dumps of all frames\n"
"\n"
"Examples:\n"
"  %s -p /dev/ttyUSB0 -f firmware.bin\n"
"  %s -p /dev/ttyUSB0 -f bootloader.bin -a Bootloader -b 460800\n"
"  %s -p /dev/ttyUSB0 -f storage.bin -o 0x290000\n", progname, progname, progname, progname);
}

/**
 * Parse command line into options
 * Returns false for usage errors or when help was requested
 */
static bool options_read(FlasherOptions &options, int argc, char **argv)
{
	const struct option long_options[] = {
		{"h",					no_argument,		0,	'h' },
		{"help",				no_argument,		0,	'h' },
		{"p",					required_argument,	0,	'p' },
		{"port",				required_argument,	0,	'p' },
		{"f",					required_argument,	0,	'f' },
		{"file",				required_argument,	0,	'f' },
		{"a",					required_argument,	0,	'a' },
		{"address",				required_argument,	0,	'a' },
		{"o",					required_argument,	0,	'o' },
		{"offset",				required_argument,	0,	'o' },
		{"b",					required_argument,	0,	'b' },
		{"baud",				required_argument,	0,	'b' },
		{"c",					required_argument,	0,	'c' },
		{"config",				required_argument,	0,	'c' },
		{"detect",				no_argument,		0,	'd' },
		{"list",				no_argument,		0,	'l' },
		{"list-addresses",		no_argument,		0,	'r' },
		{"stay",				no_argument,		0,	's' },
		{"allow-unknown",		no_argument,		0,	'u' },
		{"strict-sync",			no_argument,		0,	'x' },
		{"v",					no_argument,		0,	'v' },
		{"verbose",				no_argument,		0,	'v' },
		{"trace",				no_argument,		0,	't' },
		{0,						0,					0,	0 }
	};

	int c, i;
	optind = 1;
	while ((c = getopt_long_only(argc, argv, "", long_options, &i)) != -1)
	{
		switch (c)
		{
			case 'p':
				options.port = std::string(optarg);
				break;
			case 'f':
				options.file = std::string(optarg);
				break;
			case 'a':
				options.address = std::string(optarg);
				break;
			case 'o':
				options.address = "Custom";
				options.offset = std::string(optarg);
				break;
			case 'b':
			{
				char *end = nullptr;
				unsigned long baud = strtoul(optarg, &end, 10);
				if (end == optarg || *end != '\0' || baud == 0 || baud > UINT32_MAX)
				{
					printf("Invalid baud rate '%s'!\n", optarg);
					return false;
				}
				options.baudRate = baud;
				break;
			}
			case 'c':
				options.configFile = std::string(optarg);
				break;
			case 'd':
				options.detect = true;
				break;
			case 'l':
				options.listPorts = true;
				break;
			case 'r':
				options.listAddresses = true;
				break;
			case 's':
				options.stay = true;
				break;
			case 'u':
				options.allowUnknown = true;
				break;
			case 'x':
				options.strictSync = true;
				break;
			case 'v':
				options.verbose = true;
				break;
			case 't':
				options.trace = true;
				break;
			case 'h':
				options.help = true;
				options_printHelp(argv[0]);
				return false;
			default:
				options_printHelp(argv[0]);
				return false;
		}
	}
	if (optind < argc)
	{
		printf("Unexpected argument '%s'!\n", argv[optind]);
		options_printHelp(argv[0]);
		return false;
	}

	// ---- Checks ----

	if (options.listPorts || options.listAddresses || options.detect)
		return true;
	if (options.file.empty())
	{
		printf("No firmware file given!\n");
		options_printHelp(argv[0]);
		return false;
	}
	return true;
}

#endif // OPTIONS_H

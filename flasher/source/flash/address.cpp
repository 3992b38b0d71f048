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

#include "address.hpp"
#include "util/util.hpp"

#include <cctype>
#include <algorithm>

const std::vector<FlashAddress>& address_catalog()
{
	static const std::vector<FlashAddress> catalog = {
		{ "Bootloader",			0x1000,		"Second stage bootloader" },
		{ "Partition Table",	0x8000,		"Partition table" },
		{ "NVS",				0x9000,		"Non-volatile storage" },
		{ "OTA Data",			0xD000,		"OTA data, selects the boot partition" },
		{ "Application",		0x10000,	"Factory application" },
		{ FLASH_ADDRESS_CUSTOM,	0x0,		"Raw offset entered by the user" },
	};
	return catalog;
}

static bool equalsIgnoreCase(const std::string &a, const std::string &b)
{
	return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(),
		[](char x, char y) { return std::tolower((unsigned char)x) == std::tolower((unsigned char)y); });
}

std::optional<FlashAddress> address_lookup(const std::string &name)
{
	for (const auto &address : address_catalog())
		if (equalsIgnoreCase(address.name, name))
			return address;
	return std::nullopt;
}

std::optional<ErrorMessage> address_parseOffset(const std::string &text, uint32_t &offset)
{
	std::size_t begin = 0, end = text.size();
	while (begin < end && std::isspace((unsigned char)text[begin])) begin++;
	while (end > begin && std::isspace((unsigned char)text[end-1])) end--;
	if (end - begin >= 2 && text[begin] == '0' && (text[begin+1] == 'x' || text[begin+1] == 'X'))
		begin += 2;
	if (begin == end)
		return ErrorMessage(asprintf_s("Offset '%s' contains no hexadecimal digits!", text.c_str()), FLASH_ERROR_INVALID_ADDRESS);

	uint64_t value = 0;
	for (std::size_t i = begin; i < end; i++)
	{
		char c = text[i];
		int digit;
		if (c >= '0' && c <= '9') digit = c - '0';
		else if (c >= 'a' && c <= 'f') digit = c - 'a' + 10;
		else if (c >= 'A' && c <= 'F') digit = c - 'A' + 10;
		else return ErrorMessage(asprintf_s("Offset '%s' is not a valid hexadecimal number!", text.c_str()), FLASH_ERROR_INVALID_ADDRESS);
		value = (value << 4) | digit;
		if (value > UINT32_MAX)
			return ErrorMessage(asprintf_s("Offset '%s' exceeds the 32-bit address space!", text.c_str()), FLASH_ERROR_INVALID_ADDRESS);
	}
	offset = (uint32_t)value;
	return std::nullopt;
}

std::optional<ErrorMessage> address_resolve(const std::string &name, const std::string &customText, FlashAddress &address)
{
	auto entry = address_lookup(name);
	if (!entry)
		return ErrorMessage(asprintf_s("Unknown flash region '%s'!", name.c_str()), FLASH_ERROR_INVALID_ADDRESS);
	address = *entry;
	if (address.name != FLASH_ADDRESS_CUSTOM)
		return std::nullopt;
	return address_parseOffset(customText, address.offset);
}

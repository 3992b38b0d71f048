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

#ifndef ADDRESS_H
#define ADDRESS_H

#include "util/error.hpp"

#include <string>
#include <vector>
#include <cstdint>

#define FLASH_ADDRESS_CUSTOM "Custom"

struct FlashAddress
{
	std::string name;
	uint32_t offset;
	std::string description;
};

/**
 * Named flash regions of the default ESP32 partition layout
 * The Custom entry is a placeholder, its offset comes from caller input
 */
const std::vector<FlashAddress>& address_catalog();

/**
 * Find a catalog entry by name, case-insensitive
 */
std::optional<FlashAddress> address_lookup(const std::string &name);

/**
 * Parse a raw offset from hexadecimal text, with optional 0x/0X prefix
 */
HANDLE_ERROR address_parseOffset(const std::string &text, uint32_t &offset);

/**
 * Resolve a region name to an address, parsing customText for the Custom entry
 */
HANDLE_ERROR address_resolve(const std::string &name, const std::string &customText, FlashAddress &address);

#endif // ADDRESS_H

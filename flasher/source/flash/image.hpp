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

#ifndef IMAGE_H
#define IMAGE_H

#include "util/error.hpp"

#include <span>
#include <string>
#include <vector>
#include <cstdint>

#define IMAGE_MAGIC_ESP32		0xE9
#define IMAGE_MAGIC_ESP32S3_A	0x0C
#define IMAGE_MAGIC_ESP32S3_B	0x09
#define IMAGE_MAGIC_ESP8266		0x2F

// Advisory only, never gates protocol correctness
enum class ChipFamily : uint8_t
{
	Unknown,
	Esp32,
	Esp32S3,
	Esp8266
};

const char *getChipName(ChipFamily chip);

/**
 * Guess the chip family from the magic byte at the start of the image
 */
ChipFamily image_detectChip(std::span<const uint8_t> image);

/**
 * Rejects empty images, and unrecognised ones unless allowUnknown is set
 */
HANDLE_ERROR image_check(std::span<const uint8_t> image, bool allowUnknown, ChipFamily &chip);

HANDLE_ERROR image_load(const std::string &path, std::vector<uint8_t> &image);

#endif // IMAGE_H

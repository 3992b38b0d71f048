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

#include "image.hpp"
#include "util/util.hpp"
#include "util/log.hpp"

#include <fstream>
#include <filesystem>

const char *getChipName(ChipFamily chip)
{
	switch (chip)
	{
		case ChipFamily::Esp32: return "ESP32";
		case ChipFamily::Esp32S3: return "ESP32-S3";
		case ChipFamily::Esp8266: return "ESP8266";
		case ChipFamily::Unknown: return "Unknown";
	}
	return "Unknown";
}

ChipFamily image_detectChip(std::span<const uint8_t> image)
{
	if (image.empty()) return ChipFamily::Unknown;
	switch (image[0])
	{
		case IMAGE_MAGIC_ESP32: return ChipFamily::Esp32;
		case IMAGE_MAGIC_ESP32S3_A:
		case IMAGE_MAGIC_ESP32S3_B: return ChipFamily::Esp32S3;
		case IMAGE_MAGIC_ESP8266: return ChipFamily::Esp8266;
		default: return ChipFamily::Unknown;
	}
}

std::optional<ErrorMessage> image_check(std::span<const uint8_t> image, bool allowUnknown, ChipFamily &chip)
{
	if (image.empty())
		return ErrorMessage("Firmware image is empty!", FLASH_ERROR_EMPTY_IMAGE);
	chip = image_detectChip(image);
	if (chip != ChipFamily::Unknown)
		return std::nullopt;
	if (!allowUnknown)
		return ErrorMessage(asprintf_s("Unknown chip type, magic byte 0x%02X!", image[0]), FLASH_ERROR_UNRECOGNIZED_IMAGE);
	return std::nullopt;
}

std::optional<ErrorMessage> image_load(const std::string &path, std::vector<uint8_t> &image)
{
	std::error_code ec;
	auto size = std::filesystem::file_size(path, ec);
	if (ec) return ErrorMessage(asprintf_s("Failed to access firmware '%s': %s", path.c_str(), ec.message().c_str()));
	std::ifstream fs(path, std::ios::binary);
	if (!fs.is_open()) return ErrorMessage(asprintf_s("Failed to open '%s' for reading!", path.c_str()));
	image.resize(size);
	fs.read((char*)image.data(), size);
	if (fs.fail()) return ErrorMessage(asprintf_s("Failed to read '%s'!", path.c_str()));
	fs.close();
	LOG(LFlash, LDebug, "Loaded firmware '%s' of %d bytes", path.c_str(), (int)size);
	return std::nullopt;
}

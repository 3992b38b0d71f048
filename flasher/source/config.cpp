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

#include "config.hpp"
#include "flash/blocks.hpp"

#include "util/util.hpp"
#include "util/log.hpp"

#include "nlohmann/json.hpp"
using json = nlohmann::json;

#include <fstream>
#include <limits>
#include <stdexcept>
#include <type_traits>

/**
 * Parsing of the flasher config file
 */

static std::optional<ErrorMessage> readJSON(const std::string &path, json &data)
{
	std::ifstream fs(path);
	if (!fs.is_open()) return ErrorMessage(asprintf_s("Failed to open '%s' for reading!", path.c_str()), FLASH_ERROR_INVALID_CONFIG);
	try
	{
		fs >> data;
	}
	catch (const json::exception &e)
	{
		return ErrorMessage(asprintf_s("Failed to parse '%s': %s", path.c_str(), e.what()), FLASH_ERROR_INVALID_CONFIG);
	}
	if (fs.fail()) return ErrorMessage(asprintf_s("Failed to read '%s'!", path.c_str()), FLASH_ERROR_INVALID_CONFIG);
	return std::nullopt;
}

template<typename T>
static void readValue(const json &obj, const char *key, T &value)
{
	if (!obj.contains(key)) return;
	if constexpr (std::is_unsigned_v<T> && !std::is_same_v<T, bool>)
	{ // get<T> silently wraps negative and oversized numbers
		const json &item = obj[key];
		if (!item.is_number_unsigned() || item.get<uint64_t>() > std::numeric_limits<T>::max())
			throw std::out_of_range(asprintf_s("'%s' has to be an integer in range [0, %llu]",
				key, (unsigned long long)std::numeric_limits<T>::max()));
	}
	value = obj[key].get<T>();
}

static std::optional<ErrorMessage> parseConfigJSON(const json &cfg, FlasherConfig &config)
{
	if (!cfg.is_object())
		return ErrorMessage("Flasher config has to be a JSON object!", FLASH_ERROR_INVALID_CONFIG);

	try
	{
		if (cfg.contains("serial"))
		{
			auto &serial = cfg["serial"];
			readValue(serial, "syncBaudRate", config.syncBaudRate);
			readValue(serial, "flashBaudRate", config.flashBaudRate);
		}
		if (cfg.contains("protocol"))
		{
			auto &protocol = cfg["protocol"];
			readValue(protocol, "blockSize", config.blockSize);
			readValue(protocol, "syncAttempts", config.syncAttempts);
			readValue(protocol, "strictSync", config.strictSync);
			readValue(protocol, "validateResponses", config.validateResponses);
			readValue(protocol, "allowUnknownImage", config.allowUnknownImage);
			readValue(protocol, "reboot", config.reboot);
		}
		if (cfg.contains("timing"))
		{
			auto &timing = cfg["timing"];
			readValue(timing, "syncDelayMS", config.timing.syncDelayMS);
			readValue(timing, "syncTimeoutMS", config.timing.syncTimeoutMS);
			readValue(timing, "drainTimeoutMS", config.timing.drainTimeoutMS);
			readValue(timing, "baudSettleMS", config.timing.baudSettleMS);
			readValue(timing, "eraseSettleMS", config.timing.eraseSettleMS);
			readValue(timing, "blockDelayMS", config.timing.blockDelayMS);
			readValue(timing, "endSettleMS", config.timing.endSettleMS);
			readValue(timing, "responseTimeoutMS", config.timing.responseTimeoutMS);
			readValue(timing, "eraseTimeoutMS", config.timing.eraseTimeoutMS);
			readValue(timing, "deadlineMS", config.timing.deadlineMS);
		}
	}
	catch (const json::exception &e)
	{
		return ErrorMessage(asprintf_s("Invalid value in flasher config: %s", e.what()), FLASH_ERROR_INVALID_CONFIG);
	}
	catch (const std::out_of_range &e)
	{
		return ErrorMessage(asprintf_s("Invalid value in flasher config: %s", e.what()), FLASH_ERROR_INVALID_CONFIG);
	}

	return config_validate(config);
}

std::optional<ErrorMessage> config_validate(const FlasherConfig &config)
{
	if (config.syncBaudRate == 0 || config.flashBaudRate == 0)
		return ErrorMessage("Baud rates have to be positive!", FLASH_ERROR_INVALID_CONFIG);
	if (config.blockSize == 0 || config.blockSize > FLASH_MAX_BLOCK_SIZE)
		return ErrorMessage(asprintf_s("Block size %u is out of range [1, %d]!", config.blockSize, FLASH_MAX_BLOCK_SIZE), FLASH_ERROR_INVALID_CONFIG);
	if (config.syncAttempts < 1)
		return ErrorMessage("At least one sync attempt is required!", FLASH_ERROR_INVALID_CONFIG);
	const FlashTiming &t = config.timing;
	if (t.syncDelayMS < 0 || t.syncTimeoutMS < 0 || t.drainTimeoutMS < 0 || t.baudSettleMS < 0
		|| t.eraseSettleMS < 0 || t.blockDelayMS < 0 || t.endSettleMS < 0
		|| t.responseTimeoutMS < 0 || t.eraseTimeoutMS < 0 || t.deadlineMS < 0)
		return ErrorMessage("Timings must not be negative!", FLASH_ERROR_INVALID_CONFIG);
	return std::nullopt;
}

std::optional<ErrorMessage> parseFlasherConfigFile(const std::string &path, FlasherConfig &config)
{
	json cfg;
	auto error = readJSON(path, cfg);
	if (error) return error;
	LOG(LConfig, LDebug, "Read flasher config from '%s'", path.c_str());
	return parseConfigJSON(cfg, config);
}

std::optional<ErrorMessage> parseFlasherConfig(const std::string &text, FlasherConfig &config)
{
	json cfg = json::parse(text, nullptr, false);
	if (cfg.is_discarded())
		return ErrorMessage("Failed to parse flasher config!", FLASH_ERROR_INVALID_CONFIG);
	return parseConfigJSON(cfg, config);
}

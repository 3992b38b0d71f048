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

#include "log.hpp"

#include <cstdio>
#include <cstdarg>
#include <mutex>
#include <algorithm>

LogLevel LogFilterTable[LMaxCategory] = { LInfo, LInfo, LInfo, LInfo, LInfo };

static const char *LogCategoryIdentifiers[LMaxCategory] = { "DEF", "SER", "PRT", "FLS", "CFG" };
static const char *LogLevelIdentifiers[LMaxLevel] = { "TRACE", "DEBUG", "DARN", "INFO", "WARN", "ERROR", "" };

// Log calls may come from the flash worker and the main thread at once
static std::mutex logAccess;

void SetLogLevel(LogLevel level)
{
	for (int i = 0; i < LMaxCategory; i++)
		LogFilterTable[i] = level;
}

void SetLogLevel(LogCategory category, LogLevel level)
{
	LogFilterTable[category] = level;
}

static inline FILE *logStream(LogLevel level)
{
	return level >= LWarn && level != LOutput? stderr : stdout;
}

void PrintLog(LogCategory category, LogLevel level, const char *format, ...)
{
	std::unique_lock lock(logAccess);
	FILE *stream = logStream(level);
	if (level != LOutput)
		fprintf(stream, "[%s][%s] ", LogCategoryIdentifiers[category], LogLevelIdentifiers[level]);
	va_list args;
	va_start(args, format);
	vfprintf(stream, format, args);
	va_end(args);
	fputc('\n', stream);
	fflush(stream);
}

void PrintLogCont(LogCategory category, LogLevel level, const char *format, ...)
{
	std::unique_lock lock(logAccess);
	FILE *stream = logStream(level);
	va_list args;
	va_start(args, format);
	vfprintf(stream, format, args);
	va_end(args);
	fflush(stream);
}

void PrintLogBytes(LogCategory category, LogLevel level, const char *prefix, const uint8_t *data, std::size_t len)
{
	std::unique_lock lock(logAccess);
	FILE *stream = logStream(level);
	if (len == 0)
	{
		fprintf(stream, "[%s][%s] %s <empty>\n", LogCategoryIdentifiers[category], LogLevelIdentifiers[level], prefix);
		return;
	}
	for (std::size_t i = 0; i < len; i += 16)
	{
		fprintf(stream, "[%s][%s] %s %4zu: ", LogCategoryIdentifiers[category], LogLevelIdentifiers[level], prefix, i);
		std::size_t end = std::min(len, i+16);
		for (std::size_t j = i; j < end; j++)
			fprintf(stream, "%02X ", data[j]);
		fputc('\n', stream);
	}
	fflush(stream);
}

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

#ifndef LOG_H
#define LOG_H

#include <cstdint>
#include <cstddef>

enum LogLevel : char {
	LTrace,
	LDebug,
	LDarn, // Debug Warn
	LInfo,
	LWarn,
	LError,
	LOutput,
	LMaxLevel
};

enum LogCategory : char {
	LDefault,
	LSerial,
	LProtocol,
	LFlash,
	LConfig,
	LMaxCategory
};

// Minimum level per category that gets printed
extern LogLevel LogFilterTable[LMaxCategory];

void SetLogLevel(LogLevel level);
void SetLogLevel(LogCategory category, LogLevel level);

void PrintLog(LogCategory category, LogLevel level, const char *format, ...) __attribute__((format(printf, 3, 4)));
void PrintLogCont(LogCategory category, LogLevel level, const char *format, ...) __attribute__((format(printf, 3, 4)));
void PrintLogBytes(LogCategory category, LogLevel level, const char *prefix, const uint8_t *data, std::size_t len);

#define LOG_ENABLED(CATEGORY, LEVEL) (LEVEL >= LogFilterTable[CATEGORY])

#define LOG(CATEGORY, LEVEL, ...) { if (LOG_ENABLED(CATEGORY, LEVEL)) PrintLog(CATEGORY, LEVEL, __VA_ARGS__); }
#define LOGC(LEVEL, ...) LOG(LDefault, LEVEL, __VA_ARGS__)
#define LOGCONT(CATEGORY, LEVEL, ...) { if (LOG_ENABLED(CATEGORY, LEVEL)) PrintLogCont(CATEGORY, LEVEL, __VA_ARGS__); }
#define LOGBYTES(CATEGORY, LEVEL, PREFIX, DATA, LEN) { if (LOG_ENABLED(CATEGORY, LEVEL)) PrintLogBytes(CATEGORY, LEVEL, PREFIX, DATA, LEN); }

#endif // LOG_H

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

#ifndef UTIL_H
#define UTIL_H

#include <string>
#include <chrono>
#include <cstdio>
#include <cstdint>

/* Timing */

typedef std::chrono::steady_clock sclock;
typedef sclock::time_point TimePoint_t;

template<typename Rep = int64_t>
static inline Rep dtMS(TimePoint_t start, TimePoint_t end)
{
	return std::chrono::duration_cast<std::chrono::duration<Rep, std::milli>>(end - start).count();
}

template<typename Rep = int64_t>
static inline Rep dtUS(TimePoint_t start, TimePoint_t end)
{
	return std::chrono::duration_cast<std::chrono::duration<Rep, std::micro>>(end - start).count();
}


/* Strings */

template<typename... Args>
static inline std::string asprintf_s(const char *format, Args... args)
{
	int size = std::snprintf(nullptr, 0, format, args...);
	if (size <= 0) return "";
	std::string str(size, '\0');
	std::snprintf(str.data(), size+1, format, args...);
	return str;
}

static inline std::string asprintf_s(const char *format)
{
	return std::string(format);
}


/* Little-endian packing */

static inline void writeLE16(uint8_t *ptr, uint16_t value)
{
	ptr[0] = value & 0xFF;
	ptr[1] = (value >> 8) & 0xFF;
}

static inline void writeLE32(uint8_t *ptr, uint32_t value)
{
	ptr[0] = value & 0xFF;
	ptr[1] = (value >> 8) & 0xFF;
	ptr[2] = (value >> 16) & 0xFF;
	ptr[3] = (value >> 24) & 0xFF;
}

static inline uint16_t readLE16(const uint8_t *ptr)
{
	return (uint16_t)ptr[0] | ((uint16_t)ptr[1] << 8);
}

static inline uint32_t readLE32(const uint8_t *ptr)
{
	return (uint32_t)ptr[0] | ((uint32_t)ptr[1] << 8) | ((uint32_t)ptr[2] << 16) | ((uint32_t)ptr[3] << 24);
}

#endif // UTIL_H

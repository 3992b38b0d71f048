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

#ifndef SLIP_H
#define SLIP_H

#include <vector>
#include <cstdint>
#include <cstddef>

/**
 * SLIP framing as used by ROM bootloaders
 * A frame is delimited by SLIP_END on both sides, with END and ESC bytes in the payload escaped
 */

#define SLIP_END		0xC0
#define SLIP_ESC		0xDB
#define SLIP_ESC_END	0xDC
#define SLIP_ESC_ESC	0xDD

std::vector<uint8_t> slip_encode(const uint8_t *data, std::size_t length);

static inline std::vector<uint8_t> slip_encode(const std::vector<uint8_t> &data)
{
	return slip_encode(data.data(), data.size());
}

/**
 * Strips frame markers and unescapes
 * An ESC followed by anything but ESC_END/ESC_ESC is dropped, the following byte is kept
 */
std::vector<uint8_t> slip_decode(const uint8_t *data, std::size_t length);

static inline std::vector<uint8_t> slip_decode(const std::vector<uint8_t> &data)
{
	return slip_decode(data.data(), data.size());
}

/**
 * Incremental decoder for a byte stream as received from the transport
 * Bytes outside of a frame are skipped, empty frames are ignored
 */
struct SlipReader
{
	bool inFrame = false;
	bool escaped = false;
	std::size_t skipped = 0;
	std::vector<uint8_t> frame;

	void reset();

	/**
	 * Consumes bytes until a frame completes or the input is exhausted
	 * Returns the number of bytes consumed, complete is set if frame now holds a full frame
	 */
	std::size_t feed(const uint8_t *data, std::size_t length, bool &complete);
};

#endif // SLIP_H

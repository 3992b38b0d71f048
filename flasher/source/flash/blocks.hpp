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

#ifndef BLOCKS_H
#define BLOCKS_H

#include "util/error.hpp"

#include <span>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <iterator>

#define FLASH_ERASED_VALUE		0xFF
#define FLASH_BLOCK_SIZE		1024
#define FLASH_MAX_BLOCK_SIZE	(0xFFFF - 16) // Block plus data command header has to fit the 16-bit payload length

struct FlashBlock
{
	uint32_t sequence;
	std::vector<uint8_t> data; // Always the full block size, padded with FLASH_ERASED_VALUE
};

/**
 * Lazy split of a firmware image into fixed-size blocks
 * Blocks are only materialised when accessed, the image is never modified
 * The plan does not own the image, it has to outlive the plan
 */
struct BlockPlan
{
	std::span<const uint8_t> image;
	uint32_t blockSize = FLASH_BLOCK_SIZE;

	inline uint32_t count() const
	{
		if (blockSize == 0) return 0;
		return (uint32_t)((image.size() + blockSize - 1) / blockSize);
	}

	// Size of the flash region the blocks cover, including padding
	inline uint32_t paddedSize() const
	{
		return count() * blockSize;
	}

	FlashBlock block(uint32_t sequence) const;

	struct iterator
	{
		using iterator_category = std::input_iterator_tag;
		using value_type = FlashBlock;
		using difference_type = std::ptrdiff_t;
		using pointer = const FlashBlock*;
		using reference = FlashBlock;

		const BlockPlan *plan;
		uint32_t sequence;

		inline FlashBlock operator*() const { return plan->block(sequence); }
		inline iterator& operator++() { sequence++; return *this; }
		inline iterator operator++(int) { iterator it = *this; sequence++; return it; }
		inline bool operator==(const iterator &other) const { return plan == other.plan && sequence == other.sequence; }
		inline bool operator!=(const iterator &other) const { return !(*this == other); }
	};

	inline iterator begin() const { return iterator{ this, 0 }; }
	inline iterator end() const { return iterator{ this, count() }; }
};

/**
 * Plan the blocks for an image, fails for a zero block size
 */
HANDLE_ERROR blocks_plan(std::span<const uint8_t> image, uint32_t blockSize, BlockPlan &plan);

#endif // BLOCKS_H

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

#include "blocks.hpp"
#include "util/util.hpp"

#include <algorithm>

FlashBlock BlockPlan::block(uint32_t sequence) const
{
	FlashBlock block = {};
	block.sequence = sequence;
	// Padding to a full block lets a read-back of the last block match erased flash
	block.data.resize(blockSize, FLASH_ERASED_VALUE);
	std::size_t offset = (std::size_t)sequence * blockSize;
	if (offset >= image.size()) return block;
	std::size_t length = std::min<std::size_t>(blockSize, image.size() - offset);
	std::copy_n(image.begin() + offset, length, block.data.begin());
	return block;
}

std::optional<ErrorMessage> blocks_plan(std::span<const uint8_t> image, uint32_t blockSize, BlockPlan &plan)
{
	if (blockSize == 0)
		return ErrorMessage("Block size must not be zero!", FLASH_ERROR_INVALID_CONFIG);
	if (blockSize > FLASH_MAX_BLOCK_SIZE)
		return ErrorMessage(asprintf_s("Block size %u exceeds the maximum command payload!", blockSize), FLASH_ERROR_INVALID_CONFIG);
	plan.image = image;
	plan.blockSize = blockSize;
	return std::nullopt;
}

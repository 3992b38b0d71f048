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

#include "hash/checksum.hpp"

#include <gtest/gtest.h>

#include <vector>
#include <algorithm>

TEST(Checksum, EmptyIsSeed)
{
	EXPECT_EQ(flash_checksum(nullptr, 0), FLASH_CHECKSUM_SEED);
}

TEST(Checksum, XorFold)
{
	uint8_t data[] = { 0x01, 0x02, 0x04 };
	EXPECT_EQ(flash_checksum(data, sizeof(data)), 0xEF ^ 0x07);
	uint8_t same[] = { 0xEF };
	EXPECT_EQ(flash_checksum(same, 1), 0x00);
}

TEST(Checksum, OrderIndependent)
{
	std::vector<uint8_t> data = { 0x13, 0x37, 0xC0, 0xFF, 0x00, 0x42, 0x99 };
	uint8_t checksum = flash_checksum(data.data(), data.size());
	std::reverse(data.begin(), data.end());
	EXPECT_EQ(flash_checksum(data.data(), data.size()), checksum);
	std::rotate(data.begin(), data.begin()+3, data.end());
	EXPECT_EQ(flash_checksum(data.data(), data.size()), checksum);
}

TEST(Checksum, ErasedBlock)
{
	std::vector<uint8_t> block(1024, 0xFF);
	// Even count of 0xFF cancels out
	EXPECT_EQ(flash_checksum(block.data(), block.size()), FLASH_CHECKSUM_SEED);
}

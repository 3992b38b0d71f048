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

#include "flash/address.hpp"

#include <gtest/gtest.h>

TEST(AddressCatalog, NamedRegions)
{
	auto app = address_lookup("Application");
	ASSERT_TRUE(app);
	EXPECT_EQ(app->offset, 0x10000u);
	EXPECT_EQ(address_lookup("Bootloader")->offset, 0x1000u);
	EXPECT_EQ(address_lookup("Partition Table")->offset, 0x8000u);
	EXPECT_EQ(address_lookup("NVS")->offset, 0x9000u);
	EXPECT_EQ(address_lookup("OTA Data")->offset, 0xD000u);
	EXPECT_TRUE(address_lookup(FLASH_ADDRESS_CUSTOM));
	EXPECT_EQ(address_catalog().size(), 6u);
}

TEST(AddressCatalog, LookupIgnoresCase)
{
	auto nvs = address_lookup("nvs");
	ASSERT_TRUE(nvs);
	EXPECT_EQ(nvs->name, "NVS");
	EXPECT_FALSE(address_lookup("Firmware"));
	EXPECT_FALSE(address_lookup(""));
}

TEST(AddressOffset, ParsesHex)
{
	uint32_t offset = 0;
	ASSERT_FALSE(address_parseOffset("0x8000", offset));
	EXPECT_EQ(offset, 0x8000u);
	ASSERT_FALSE(address_parseOffset("0X1a000", offset));
	EXPECT_EQ(offset, 0x1A000u);
	ASSERT_FALSE(address_parseOffset("  290000 \n", offset));
	EXPECT_EQ(offset, 0x290000u);
	ASSERT_FALSE(address_parseOffset("FFFFFFFF", offset));
	EXPECT_EQ(offset, 0xFFFFFFFFu);
}

TEST(AddressOffset, RejectsInvalid)
{
	uint32_t offset = 0x1234;
	for (const char *text : { "zz", "", "0x", "   ", "0x12g4", "-10", "0x100000000", "12 34" })
	{
		auto error = address_parseOffset(text, offset);
		ASSERT_TRUE(error) << "'" << text << "'";
		EXPECT_EQ(error->kind(), FLASH_ERROR_INVALID_ADDRESS);
	}
	EXPECT_EQ(offset, 0x1234u);
}

TEST(AddressResolve, NamedAndCustom)
{
	FlashAddress address;
	ASSERT_FALSE(address_resolve("Application", "ignored", address));
	EXPECT_EQ(address.offset, 0x10000u);

	ASSERT_FALSE(address_resolve(FLASH_ADDRESS_CUSTOM, "0x290000", address));
	EXPECT_EQ(address.name, FLASH_ADDRESS_CUSTOM);
	EXPECT_EQ(address.offset, 0x290000u);

	auto error = address_resolve(FLASH_ADDRESS_CUSTOM, "zz", address);
	ASSERT_TRUE(error);
	EXPECT_EQ(error->kind(), FLASH_ERROR_INVALID_ADDRESS);

	error = address_resolve("Firmware", "", address);
	ASSERT_TRUE(error);
	EXPECT_EQ(error->kind(), FLASH_ERROR_INVALID_ADDRESS);
}

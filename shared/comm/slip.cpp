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

#include "slip.hpp"

std::vector<uint8_t> slip_encode(const uint8_t *data, std::size_t length)
{
	std::vector<uint8_t> framed;
	framed.reserve(length + length/16 + 2);
	framed.push_back(SLIP_END);
	for (std::size_t i = 0; i < length; i++)
	{
		if (data[i] == SLIP_END)
		{
			framed.push_back(SLIP_ESC);
			framed.push_back(SLIP_ESC_END);
		}
		else if (data[i] == SLIP_ESC)
		{
			framed.push_back(SLIP_ESC);
			framed.push_back(SLIP_ESC_ESC);
		}
		else
			framed.push_back(data[i]);
	}
	framed.push_back(SLIP_END);
	return framed;
}

std::vector<uint8_t> slip_decode(const uint8_t *data, std::size_t length)
{
	std::vector<uint8_t> payload;
	payload.reserve(length);
	bool escaped = false;
	for (std::size_t i = 0; i < length; i++)
	{
		uint8_t byte = data[i];
		if (escaped)
		{
			escaped = false;
			if (byte == SLIP_ESC_END)
			{
				payload.push_back(SLIP_END);
				continue;
			}
			if (byte == SLIP_ESC_ESC)
			{
				payload.push_back(SLIP_ESC);
				continue;
			}
			// Malformed escape, drop it and handle byte normally to resynchronise
		}
		if (byte == SLIP_END)
			continue;
		if (byte == SLIP_ESC)
			escaped = true;
		else
			payload.push_back(byte);
	}
	return payload;
}

void SlipReader::reset()
{
	inFrame = false;
	escaped = false;
	skipped = 0;
	frame.clear();
}

std::size_t SlipReader::feed(const uint8_t *data, std::size_t length, bool &complete)
{
	complete = false;
	std::size_t i = 0;
	while (i < length)
	{
		uint8_t byte = data[i++];
		if (!inFrame)
		{
			if (byte == SLIP_END)
			{
				inFrame = true;
				escaped = false;
				frame.clear();
			}
			else
				skipped++;
			continue;
		}
		if (escaped)
		{
			escaped = false;
			if (byte == SLIP_ESC_END)
			{
				frame.push_back(SLIP_END);
				continue;
			}
			if (byte == SLIP_ESC_ESC)
			{
				frame.push_back(SLIP_ESC);
				continue;
			}
		}
		if (byte == SLIP_END)
		{
			if (frame.empty())
				continue; // Back-to-back markers, treat second as start of the next frame
			inFrame = false;
			complete = true;
			return i;
		}
		if (byte == SLIP_ESC)
			escaped = true;
		else
			frame.push_back(byte);
	}
	return i;
}

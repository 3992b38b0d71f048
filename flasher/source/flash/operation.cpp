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

#include "operation.hpp"

#include "util/log.hpp"

FlashOperation::~FlashOperation()
{
	control.stop();
}

void FlashOperation::push(const FlashEvent &event)
{
	{
		std::unique_lock lock(eventMutex);
		events.push_back(event);
		if (event.type != FLASH_EVENT_STATUS)
		{
			ended = true;
			result = event;
		}
	}
	eventCV.notify_all();
}

bool FlashOperation::next(FlashEvent &event)
{
	std::unique_lock lock(eventMutex);
	eventCV.wait(lock, [&]{ return !events.empty() || ended; });
	if (events.empty())
		return false;
	event = std::move(events.front());
	events.pop_front();
	return true;
}

bool FlashOperation::next(FlashEvent &event, int timeoutMS)
{
	std::unique_lock lock(eventMutex);
	eventCV.wait_for(lock, std::chrono::milliseconds(timeoutMS), [&]{ return !events.empty() || ended; });
	if (events.empty())
		return false;
	event = std::move(events.front());
	events.pop_front();
	return true;
}

void FlashOperation::cancel()
{
	control.stop_source.request_stop();
}

FlashEvent FlashOperation::wait()
{
	control.join();
	std::unique_lock lock(eventMutex);
	return result;
}

bool FlashOperation::finished() const
{
	std::unique_lock lock(eventMutex);
	return ended;
}

std::unique_ptr<FlashOperation> startFlash(const TransportFactory &factory, const std::string &transportID,
	std::vector<uint8_t> firmware, FlashAddress address, FlasherConfig config)
{
	auto operation = std::make_unique<FlashOperation>();
	FlashOperation *op = operation.get();
	op->control.init();
	op->control.thread = new std::thread([op, factory, transportID, firmware = std::move(firmware), address = std::move(address), config]
		(std::stop_token stop) mutable
	{
		std::unique_ptr<Transport> transport;
		if (factory)
			transport = factory(transportID);
		if (!transport)
		{
			LOG(LFlash, LError, "No transport available for '%s'!", transportID.c_str());
			FlashEvent failure = {};
			failure.type = FLASH_EVENT_FAILURE;
			failure.phase = FlashPhase::Failed;
			failure.error = FLASH_ERROR_TRANSPORT_UNAVAILABLE;
			failure.message = asprintf_s("No transport available for '%s'!", transportID.c_str());
			failure.address = address.offset;
			failure.sizeBytes = firmware.size();
			op->push(failure);
		}
		else
		{
			FlashSession session(std::move(transport), std::move(address), std::move(firmware), config);
			FlashEventSink sink = [op](const FlashEvent &event) { op->push(event); };
			FlashEvent record = session.run(stop, sink);
			LOG(LFlash, LDebug, "Flash operation ended in phase %s", getPhaseName(record.phase));
		}
		op->control.finished = true;
	}, op->control.stop_source.get_token());
	return operation;
}

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

#ifndef OPERATION_H
#define OPERATION_H

#include "flash/session.hpp"

#include "util/threading.hpp"

#include <deque>
#include <mutex>
#include <condition_variable>

/**
 * Handle to a flash session running on its own thread
 * Events are queued in emission order and consumed with next()
 */
class FlashOperation
{
public:
	FlashOperation() = default;
	~FlashOperation();

	FlashOperation(const FlashOperation&) = delete;
	FlashOperation& operator=(const FlashOperation&) = delete;

	/**
	 * Blocks until the next event is available
	 * Returns false once the final record has been consumed
	 */
	bool next(FlashEvent &event);

	/**
	 * Waits at most timeoutMS for the next event
	 * Returns false on timeout or once the final record has been consumed
	 */
	bool next(FlashEvent &event, int timeoutMS);

	/**
	 * Request cancellation, the session fails with a Cancelled record at its next checkpoint
	 */
	void cancel();

	/**
	 * Join the worker thread and return the final record
	 */
	FlashEvent wait();

	bool finished() const;

private:
	friend std::unique_ptr<FlashOperation> startFlash(const TransportFactory &factory, const std::string &transportID,
		std::vector<uint8_t> firmware, FlashAddress address, FlasherConfig config);

	mutable std::mutex eventMutex;
	std::condition_variable eventCV;
	std::deque<FlashEvent> events;
	bool ended = false;
	FlashEvent result = {};

	void push(const FlashEvent &event);

	// Declared last so the thread is joined before the queue is destroyed
	ThreadControl control;
};

/**
 * Create the transport for transportID and run a flash session on a new thread
 */
std::unique_ptr<FlashOperation> startFlash(const TransportFactory &factory, const std::string &transportID,
	std::vector<uint8_t> firmware, FlashAddress address, FlasherConfig config);

#endif // OPERATION_H

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "util/BindMethod.hxx"

#include <cstddef>
#include <utility>

namespace Gelf {

/**
 * Counts the messages and chunks which are currently being sent.
 * Each counter is incremented by obtaining a #Lease and decremented
 * when the #Lease is destructed.
 */
class InFlightTracker {
	std::size_t messages = 0, chunks = 0;

	using Callback = BoundMethod<void() noexcept>;

	/**
	 * Invoked each time a counter drops to zero.
	 */
	Callback zero_callback{nullptr};

public:
	class Lease {
		std::size_t *counter = nullptr;
		InFlightTracker *tracker;

	public:
		Lease(InFlightTracker &_tracker, std::size_t &_counter) noexcept
			:counter(&_counter), tracker(&_tracker)
		{
			++*counter;
		}

		Lease(Lease &&src) noexcept
			:counter(std::exchange(src.counter, nullptr)),
			 tracker(src.tracker) {}

		~Lease() noexcept {
			if (counter != nullptr)
				tracker->Release(*counter);
		}

		Lease &operator=(Lease &&) = delete;
	};

	InFlightTracker() = default;

	InFlightTracker(const InFlightTracker &) = delete;
	InFlightTracker &operator=(const InFlightTracker &) = delete;

	void SetZeroCallback(Callback _callback) noexcept {
		zero_callback = _callback;
	}

	[[nodiscard]]
	Lease BeginMessage() noexcept {
		return {*this, messages};
	}

	[[nodiscard]]
	Lease BeginChunk() noexcept {
		return {*this, chunks};
	}

	std::size_t GetMessages() const noexcept {
		return messages;
	}

	std::size_t GetChunks() const noexcept {
		return chunks;
	}

	bool IsIdle() const noexcept {
		return messages == 0 && chunks == 0;
	}

private:
	void Release(std::size_t &counter) noexcept {
		if (--counter == 0 && zero_callback)
			zero_callback();
	}
};

} // namespace Gelf

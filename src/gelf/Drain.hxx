// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "event/DeferEvent.hxx"
#include "io/Logger.hxx"
#include "co/AwaitableHelper.hxx"
#include "util/BindMethod.hxx"

#include <cstdint>

namespace Gelf {

class InFlightTracker;

/**
 * Implements the one-shot close operation: wait until all messages
 * and chunks which are in flight have been sent, then release the
 * transport.
 */
class DrainController {
public:
	enum class State : uint8_t {
		OPEN,

		/**
		 * Close was requested, but messages are still in
		 * flight.
		 */
		DRAINING,

		CLOSED,
	};

private:
	const LLogger logger;

	InFlightTracker &tracker;

	using Callback = BoundMethod<void() noexcept>;

	/**
	 * Releases the transport; invoked exactly once when entering
	 * #State::CLOSED.
	 */
	const Callback release_callback;

	/**
	 * Resumes the coroutine waiting for #State::CLOSED in a new
	 * stack frame.
	 */
	DeferEvent defer_resume;

	std::coroutine_handle<> continuation;

	State state = State::OPEN;

	using Awaitable = Co::AwaitableHelper<DrainController, false>;
	friend Awaitable;

public:
	DrainController(EventLoop &event_loop, InFlightTracker &_tracker,
			Callback _release_callback) noexcept;

	DrainController(const DrainController &) = delete;
	DrainController &operator=(const DrainController &) = delete;

	State GetState() const noexcept {
		return state;
	}

	bool IsClosed() const noexcept {
		return state == State::CLOSED;
	}

	/**
	 * Enter #State::DRAINING and close as soon as nothing is in
	 * flight (which may be right now).
	 *
	 * Throws #AlreadyClosingError if this was called before or if
	 * the transport was destroyed already.
	 */
	void RequestClose();

	/**
	 * Close immediately without waiting for messages in flight.
	 */
	void Destroy() noexcept;

	/**
	 * Suspend the caller until #State::CLOSED is reached.
	 */
	[[nodiscard]]
	Awaitable operator co_await() noexcept {
		return *this;
	}

private:
	/**
	 * Enter #State::CLOSED.
	 */
	void Finish() noexcept;

	void CheckIdle() noexcept;

	void OnCounterZero() noexcept {
		if (state == State::DRAINING)
			CheckIdle();
	}

	void OnDeferredResume() noexcept;

	/* methods for Awaitable */
	bool IsReady() const noexcept {
		return IsClosed();
	}

	void TakeValue() const noexcept {}
};

} // namespace Gelf

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "SocketEvent.hxx"
#include "system/Error.hxx"
#include "co/AwaitableHelper.hxx"

#include <exception>

/**
 * A helper class that makes #SocketEvent awaitable by a coroutine.
 * The awaiting coroutine is resumed with the ready event flags as
 * soon as the socket reports one of the given events.
 */
class AwaitableSocketEvent final {
	SocketEvent event;

	std::coroutine_handle<> continuation;

	std::exception_ptr error;

	unsigned events = 0;

	using Awaitable = Co::AwaitableHelper<AwaitableSocketEvent>;
	friend Awaitable;

public:
	AwaitableSocketEvent(EventLoop &event_loop, SocketDescriptor socket,
			     unsigned flags) noexcept
		:event(event_loop, BIND_THIS_METHOD(OnSocketReady), socket)
	{
		if (!event.Schedule(flags))
			error = std::make_exception_ptr(MakeErrno("epoll_ctl() failed"));
	}

	AwaitableSocketEvent(const AwaitableSocketEvent &) = delete;
	AwaitableSocketEvent &operator=(const AwaitableSocketEvent &) = delete;

	[[nodiscard]]
	Awaitable operator co_await() noexcept {
		return *this;
	}

private:
	bool IsReady() const noexcept {
		return error || event.GetScheduledFlags() == 0;
	}

	unsigned TakeValue() noexcept {
		return events;
	}

	void OnSocketReady(unsigned _events) noexcept {
		events = _events;
		event.Cancel();

		if (continuation)
			continuation.resume();
	}
};

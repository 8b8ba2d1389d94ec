// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Drain.hxx"
#include "InFlight.hxx"
#include "Error.hxx"

#include <utility>

namespace Gelf {

DrainController::DrainController(EventLoop &event_loop,
				 InFlightTracker &_tracker,
				 Callback _release_callback) noexcept
	:logger("gelf"),
	 tracker(_tracker),
	 release_callback(_release_callback),
	 defer_resume(event_loop, BIND_THIS_METHOD(OnDeferredResume))
{
	tracker.SetZeroCallback(BIND_THIS_METHOD(OnCounterZero));
}

void
DrainController::RequestClose()
{
	if (state != State::OPEN)
		throw AlreadyClosingError{};

	logger.Fmt(4, "Close requested; {} messages and {} chunks in flight",
		   tracker.GetMessages(), tracker.GetChunks());

	state = State::DRAINING;
	CheckIdle();
}

void
DrainController::Destroy() noexcept
{
	if (state == State::CLOSED)
		return;

	logger.Fmt(4, "Destroying; {} messages and {} chunks in flight",
		   tracker.GetMessages(), tracker.GetChunks());

	Finish();
}

inline void
DrainController::Finish() noexcept
{
	state = State::CLOSED;
	release_callback();

	if (continuation)
		defer_resume.Schedule();
}

void
DrainController::CheckIdle() noexcept
{
	if (!tracker.IsIdle())
		return;

	logger(4, "Nothing in flight; closing");
	Finish();
}

void
DrainController::OnDeferredResume() noexcept
{
	std::exchange(continuation, {}).resume();
}

} // namespace Gelf

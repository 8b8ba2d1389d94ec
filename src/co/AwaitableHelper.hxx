// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Compat.hxx"

#include <exception>

namespace Co {

/**
 * A helper for implementing an awaitable class on top of an
 * asynchronous operation.
 *
 * The class #T must have a field "continuation" of type
 * std::coroutine_handle<>, a method IsReady() and a method
 * TakeValue().  If #rethrow is true, it must also have a field
 * "error" of type std::exception_ptr which is rethrown by
 * await_resume().
 */
template<typename T, bool rethrow=true>
class AwaitableHelper {
protected:
	T &task;

public:
	constexpr AwaitableHelper(T &_task) noexcept
		:task(_task) {}

	[[nodiscard]]
	bool await_ready() const noexcept {
		return task.IsReady();
	}

	void await_suspend(std::coroutine_handle<> _continuation) noexcept {
		task.continuation = _continuation;
	}

	decltype(auto) await_resume() noexcept(!rethrow) {
		if constexpr (rethrow)
			if (task.error)
				std::rethrow_exception(task.error);

		return task.TakeValue();
	}
};

} // namespace Co

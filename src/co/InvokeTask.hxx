// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "UniqueHandle.hxx"
#include "util/BindMethod.hxx"

#include <cassert>
#include <exception>
#include <utility>

namespace Co {

/**
 * A helper task which invokes a coroutine from synchronous code.
 * The coroutine is suspended initially; call Start() to run it.
 * The completion callback receives the exception (if any).
 */
class [[nodiscard]] InvokeTask {
public:
	using Callback = BoundMethod<void(std::exception_ptr error) noexcept>;

	struct promise_type {
		Callback callback{nullptr};

		std::exception_ptr error;

		auto initial_suspend() noexcept {
			return std::suspend_always{};
		}

		struct final_awaitable {
			bool await_ready() const noexcept {
				return false;
			}

			template<typename PROMISE>
			void await_suspend(std::coroutine_handle<PROMISE> coro) noexcept {
				auto &p = coro.promise();
				p.callback(std::move(p.error));
			}

			void await_resume() const noexcept {
			}
		};

		auto final_suspend() noexcept {
			return final_awaitable{};
		}

		void return_void() noexcept {
		}

		InvokeTask get_return_object() noexcept {
			return InvokeTask(std::coroutine_handle<promise_type>::from_promise(*this));
		}

		void unhandled_exception() noexcept {
			error = std::current_exception();
		}
	};

private:
	UniqueHandle<promise_type> coroutine;

	explicit InvokeTask(std::coroutine_handle<promise_type> _coroutine) noexcept
		:coroutine(_coroutine)
	{
	}

public:
	InvokeTask() = default;

	operator bool() const noexcept {
		return coroutine;
	}

	/**
	 * Start the coroutine.  The callback will be invoked when it
	 * finishes; this may happen before this method returns.
	 */
	void Start(Callback callback) noexcept {
		assert(callback);
		assert(coroutine);
		assert(!coroutine.get().done());

		coroutine.get().promise().callback = callback;
		coroutine.get().resume();
	}
};

} // namespace Co

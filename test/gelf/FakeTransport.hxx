// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "../co/PauseTask.hxx"
#include "gelf/Endpoint.hxx"
#include "gelf/Error.hxx"
#include "gelf/Transport.hxx"

#include <cstddef>
#include <exception>
#include <list>
#include <vector>

/**
 * A #Gelf::DatagramTransport which records all datagrams.  In "hold"
 * mode, each Send() call is suspended until ResumeOne() is called.
 */
class FakeTransport final : public Gelf::DatagramTransport {
	std::list<Co::PauseTask> pauses;

public:
	struct Datagram {
		std::vector<std::byte> data;
		Gelf::Endpoint endpoint;
	};

	std::vector<Datagram> sent;

	/**
	 * If set, Send() fails with this error once #fail_after
	 * datagrams have been sent.
	 */
	std::exception_ptr error;

	std::size_t fail_after = 0;

	bool hold = false;

	bool closed = false;

	/**
	 * The number of Send() calls which are currently suspended.
	 */
	std::size_t GetHeldCount() const noexcept {
		std::size_t n = 0;
		for (const auto &i : pauses)
			if (i.IsAwaited() && !i.IsResumed())
				++n;
		return n;
	}

	/**
	 * Let the oldest suspended Send() call continue.
	 */
	void ResumeOne() noexcept {
		for (auto &i : pauses) {
			if (i.IsAwaited() && !i.IsResumed()) {
				i.Resume();
				return;
			}
		}
	}

	/* virtual methods from class Gelf::DatagramTransport */
	Co::Task<std::size_t> Send(std::span<const std::byte> datagram,
				   const Gelf::Endpoint &endpoint) override {
		if (closed)
			throw Gelf::SocketDestroyedError{};

		if (hold)
			co_await pauses.emplace_back();

		if (error && sent.size() >= fail_after)
			std::rethrow_exception(error);

		sent.push_back({{datagram.begin(), datagram.end()}, endpoint});
		co_return datagram.size();
	}

	void Close() noexcept override {
		closed = true;
	}
};

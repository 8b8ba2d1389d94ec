// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "DeferEvent.hxx"
#include "SocketEvent.hxx"
#include "system/EpollFD.hxx"

#include <boost/intrusive/list.hpp>

/**
 * An event loop that polls for events on file/socket descriptors.
 *
 * This class is not thread-safe, all methods must be called from the
 * thread that runs it.
 *
 * @see SocketEvent, DeferEvent
 */
class EventLoop final
{
	EpollFD poll_backend;

	using DeferList =
		boost::intrusive::list<DeferEvent,
				       boost::intrusive::base_hook<boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::auto_unlink>>>,
				       boost::intrusive::constant_time_size<false>>;

	DeferList defer;

	using SocketList =
		boost::intrusive::list<SocketEvent,
				       boost::intrusive::base_hook<boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::auto_unlink>>>,
				       boost::intrusive::constant_time_size<false>>;

	/**
	 * A list of scheduled #SocketEvent instances, without those
	 * which are ready (these are in #ready_sockets).
	 */
	SocketList sockets;

	/**
	 * A list of #SocketEvent instances which have a non-zero
	 * "ready_flags" field and need to be dispatched.
	 */
	SocketList ready_sockets;

	bool quit = false;

public:
	/**
	 * Throws on error.
	 */
	EventLoop();
	~EventLoop() noexcept;

	EventLoop(const EventLoop &other) = delete;
	EventLoop &operator=(const EventLoop &other) = delete;

	/**
	 * Stop execution of this #EventLoop at the next chance.
	 */
	void Break() noexcept {
		quit = true;
	}

	bool IsEmpty() const noexcept {
		return defer.empty() &&
			sockets.empty() && ready_sockets.empty();
	}

	bool AddFD(int fd, unsigned events, SocketEvent &event) noexcept;
	bool ModifyFD(int fd, unsigned events, SocketEvent &event) noexcept;
	bool RemoveFD(int fd, SocketEvent &event) noexcept;

	/**
	 * Schedule a call to DeferEvent::Run().
	 */
	void AddDefer(DeferEvent &e) noexcept;

	/**
	 * The main function of this class.  It will loop until
	 * Break() gets called or until there are no more registered
	 * events.
	 */
	void Run() noexcept;

private:
	void RunDeferred() noexcept;

	/**
	 * Call epoll_wait() and pass all returned events to
	 * SocketEvent::SetReadyFlags().
	 *
	 * @return true if one or more sockets have become ready
	 */
	bool Wait(int timeout_ms) noexcept;
};

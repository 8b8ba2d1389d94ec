// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <sys/epoll.h>

/**
 * A class that wraps a Linux epoll file descriptor.
 */
class EpollFD {
	int fd;

public:
	/**
	 * Throws on error.
	 */
	EpollFD();

	~EpollFD() noexcept;

	EpollFD(const EpollFD &) = delete;
	EpollFD &operator=(const EpollFD &) = delete;

	int Wait(struct epoll_event *events, int maxevents,
		 int timeout) noexcept;

	bool Add(int other_fd, unsigned events, void *ptr) noexcept {
		return Control(EPOLL_CTL_ADD, other_fd, events, ptr);
	}

	bool Modify(int other_fd, unsigned events, void *ptr) noexcept {
		return Control(EPOLL_CTL_MOD, other_fd, events, ptr);
	}

	bool Remove(int other_fd) noexcept {
		return Control(EPOLL_CTL_DEL, other_fd, 0, nullptr);
	}

private:
	bool Control(int op, int other_fd, unsigned events, void *ptr) noexcept;
};

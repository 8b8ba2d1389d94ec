// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "EpollFD.hxx"
#include "Error.hxx"

#include <unistd.h>

EpollFD::EpollFD()
	:fd(epoll_create1(EPOLL_CLOEXEC))
{
	if (fd < 0)
		throw MakeErrno("epoll_create1() failed");
}

EpollFD::~EpollFD() noexcept
{
	close(fd);
}

int
EpollFD::Wait(struct epoll_event *events, int maxevents, int timeout) noexcept
{
	return epoll_wait(fd, events, maxevents, timeout);
}

bool
EpollFD::Control(int op, int other_fd, unsigned events, void *ptr) noexcept
{
	struct epoll_event event;
	event.events = events;
	event.data.ptr = ptr;

	return epoll_ctl(fd, op, other_fd, &event) >= 0;
}

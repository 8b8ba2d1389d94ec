// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SocketDescriptor.hxx"
#include "SocketAddress.hxx"
#include "AllocatedSocketAddress.hxx"

#include <sys/socket.h>
#include <unistd.h>

bool
SocketDescriptor::Create(int domain, int type, int protocol) noexcept
{
	type |= SOCK_CLOEXEC;

	int new_fd = socket(domain, type, protocol);
	if (new_fd < 0)
		return false;

	fd = new_fd;
	return true;
}

bool
SocketDescriptor::CreateNonBlock(int domain, int type, int protocol) noexcept
{
	return Create(domain, type | SOCK_NONBLOCK, protocol);
}

void
SocketDescriptor::Close() noexcept
{
	if (IsDefined())
		close(fd);

	fd = -1;
}

bool
SocketDescriptor::Bind(SocketAddress address) const noexcept
{
	return bind(Get(), address.GetAddress(), address.GetSize()) == 0;
}

AllocatedSocketAddress
SocketDescriptor::GetLocalAddress() const
{
	struct sockaddr_storage storage;
	socklen_t size = sizeof(storage);
	if (getsockname(Get(), (struct sockaddr *)&storage, &size) < 0)
		return {};

	return AllocatedSocketAddress{SocketAddress{(const struct sockaddr *)&storage, size}};
}

ssize_t
SocketDescriptor::WriteToNoWait(std::span<const std::byte> src,
				SocketAddress address) const noexcept
{
	return sendto(Get(), src.data(), src.size(),
		      MSG_DONTWAIT|MSG_NOSIGNAL,
		      address.GetAddress(), address.GetSize());
}

ssize_t
SocketDescriptor::ReadNoWait(std::span<std::byte> dest) const noexcept
{
	return recv(Get(), dest.data(), dest.size(), MSG_DONTWAIT);
}

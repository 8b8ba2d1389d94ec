// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>

#include <sys/types.h>

class SocketAddress;
class AllocatedSocketAddress;

/**
 * An OO wrapper for a UNIX socket descriptor.  It does not own the
 * descriptor; see #UniqueSocketDescriptor.
 */
class SocketDescriptor {
protected:
	int fd;

public:
	SocketDescriptor() = default;

	explicit constexpr SocketDescriptor(int _fd) noexcept
		:fd(_fd) {}

	constexpr bool operator==(SocketDescriptor other) const noexcept {
		return fd == other.fd;
	}

	constexpr bool IsDefined() const noexcept {
		return fd >= 0;
	}

	static constexpr SocketDescriptor Undefined() noexcept {
		return SocketDescriptor(-1);
	}

	constexpr int Get() const noexcept {
		return fd;
	}

	/**
	 * @return true on success, false on error (with errno set)
	 */
	bool Create(int domain, int type, int protocol) noexcept;

	/**
	 * Like Create(), but enable non-blocking mode.
	 */
	bool CreateNonBlock(int domain, int type, int protocol) noexcept;

	void Close() noexcept;

	bool Bind(SocketAddress address) const noexcept;

	/**
	 * Obtain the local address of this socket (with getsockname()).
	 * Returns a "null" instance on error.
	 */
	AllocatedSocketAddress GetLocalAddress() const;

	/**
	 * Send a datagram to the given address without blocking.
	 */
	ssize_t WriteToNoWait(std::span<const std::byte> src,
			      SocketAddress address) const noexcept;

	/**
	 * Receive one datagram without blocking.
	 */
	ssize_t ReadNoWait(std::span<std::byte> dest) const noexcept;
};

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <cstdint>

#include <sys/socket.h>

/**
 * An OO wrapper for struct sockaddr.  It does not own the memory it
 * points to.
 */
class SocketAddress {
	const struct sockaddr *address = nullptr;
	socklen_t size = 0;

public:
	SocketAddress() = default;

	constexpr SocketAddress(std::nullptr_t) noexcept {}

	constexpr SocketAddress(const struct sockaddr *_address,
				socklen_t _size) noexcept
		:address(_address), size(_size) {}

	static constexpr SocketAddress Null() noexcept {
		return nullptr;
	}

	constexpr bool IsNull() const noexcept {
		return address == nullptr;
	}

	constexpr const struct sockaddr *GetAddress() const noexcept {
		return address;
	}

	constexpr socklen_t GetSize() const noexcept {
		return size;
	}

	constexpr int GetFamily() const noexcept {
		return address->sa_family;
	}

	/**
	 * Does the object have a well-defined address?  Check !IsNull()
	 * before calling this method.
	 */
	constexpr bool IsDefined() const noexcept {
		return GetFamily() != AF_UNSPEC;
	}

	/**
	 * Extract the port number.  Returns 0 if not applicable.
	 */
	[[gnu::pure]]
	unsigned GetPort() const noexcept;

	[[gnu::pure]]
	bool operator==(const SocketAddress other) const noexcept;
};

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "SocketAddress.hxx"

#include <utility>

/**
 * A copy of a #SocketAddress allocated on the heap.
 */
class AllocatedSocketAddress {
	struct sockaddr *address = nullptr;
	socklen_t size = 0;

public:
	AllocatedSocketAddress() = default;

	explicit AllocatedSocketAddress(SocketAddress src) {
		*this = src;
	}

	AllocatedSocketAddress(const AllocatedSocketAddress &src)
		:AllocatedSocketAddress((SocketAddress)src) {}

	AllocatedSocketAddress(AllocatedSocketAddress &&src) noexcept
		:address(std::exchange(src.address, nullptr)),
		 size(std::exchange(src.size, 0)) {}

	~AllocatedSocketAddress() noexcept;

	AllocatedSocketAddress &operator=(SocketAddress src);

	AllocatedSocketAddress &operator=(const AllocatedSocketAddress &src) {
		return *this = (SocketAddress)src;
	}

	AllocatedSocketAddress &operator=(AllocatedSocketAddress &&src) noexcept {
		using std::swap;
		swap(address, src.address);
		swap(size, src.size);
		return *this;
	}

	bool IsNull() const noexcept {
		return address == nullptr;
	}

	socklen_t GetSize() const noexcept {
		return size;
	}

	const struct sockaddr *GetAddress() const noexcept {
		return address;
	}

	operator SocketAddress() const noexcept {
		return {address, size};
	}

	unsigned GetPort() const noexcept {
		return SocketAddress(*this).GetPort();
	}

	void Clear() noexcept;

private:
	void SetSize(socklen_t new_size);
};

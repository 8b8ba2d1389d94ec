// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "AllocatedSocketAddress.hxx"

#include <new>

#include <stdlib.h>
#include <string.h>

AllocatedSocketAddress::~AllocatedSocketAddress() noexcept
{
	free(address);
}

AllocatedSocketAddress &
AllocatedSocketAddress::operator=(SocketAddress src)
{
	if (src.IsNull()) {
		Clear();
	} else {
		SetSize(src.GetSize());
		memcpy(address, src.GetAddress(), size);
	}

	return *this;
}

void
AllocatedSocketAddress::Clear() noexcept
{
	free(address);
	address = nullptr;
	size = 0;
}

void
AllocatedSocketAddress::SetSize(socklen_t new_size)
{
	if (size == new_size)
		return;

	free(address);
	address = (struct sockaddr *)malloc(new_size);
	if (address == nullptr) {
		size = 0;
		throw std::bad_alloc();
	}

	size = new_size;
}

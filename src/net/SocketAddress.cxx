// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SocketAddress.hxx"

#include <string.h>
#include <netinet/in.h>

unsigned
SocketAddress::GetPort() const noexcept
{
	if (IsNull())
		return 0;

	switch (GetFamily()) {
	case AF_INET:
		return ntohs(reinterpret_cast<const struct sockaddr_in *>(address)->sin_port);

	case AF_INET6:
		return ntohs(reinterpret_cast<const struct sockaddr_in6 *>(address)->sin6_port);

	default:
		return 0;
	}
}

bool
SocketAddress::operator==(const SocketAddress other) const noexcept
{
	return size == other.size &&
		(size == 0 || memcmp(address, other.address, size) == 0);
}

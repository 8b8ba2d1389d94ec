// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Urandom.hxx"
#include "Error.hxx"

#include <stdexcept>

#include <sys/random.h>

/**
 * @return the number of bytes filled; never zero
 */
static std::size_t
GetRandom(std::span<std::byte> dest)
{
	ssize_t nbytes;

	do {
		nbytes = getrandom(dest.data(), dest.size(), 0);
	} while (nbytes < 0 && errno == EINTR);

	if (nbytes < 0)
		throw MakeErrno("getrandom() failed");

	if (nbytes == 0)
		throw std::runtime_error("getrandom() returned no data");

	return static_cast<std::size_t>(nbytes);
}

void
UrandomFill(std::span<std::byte> dest)
{
	/* getrandom() may return less than requested if interrupted
	   by a signal while blocking */
	while (!dest.empty())
		dest = dest.subspan(GetRandom(dest));
}

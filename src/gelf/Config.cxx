// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"
#include "system/Error.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <unistd.h>

using std::string_view_literals::operator""sv;

namespace Gelf {

std::string_view
ToString(Compression compression) noexcept
{
	switch (compression) {
	case Compression::OPTIMAL:
		return "optimal"sv;

	case Compression::ALWAYS:
		return "always"sv;

	case Compression::NEVER:
		return "never"sv;
	}

	return "unknown"sv;
}

Compression
ParseCompression(std::string_view s)
{
	if (s == "optimal"sv)
		return Compression::OPTIMAL;
	else if (s == "always"sv)
		return Compression::ALWAYS;
	else if (s == "never"sv)
		return Compression::NEVER;
	else
		throw FmtInvalidArgument("deflate must be one of \"optimal\", \"always\", or \"never\". was \"{}\"",
					 s);
}

std::string
GetLocalHostName()
{
	char buffer[256];
	if (gethostname(buffer, sizeof(buffer)) < 0)
		throw MakeErrno("gethostname() failed");

	/* POSIX does not guarantee null-termination on truncation */
	buffer[sizeof(buffer) - 1] = 0;
	return buffer;
}

void
Config::Check() const
{
	if (servers.empty())
		throw std::invalid_argument("No GELF server configured");

	if (buffer_size <= CHUNK_HEADER_SIZE)
		throw FmtInvalidArgument("Buffer size {} is too small, must be larger than {}",
					 buffer_size, CHUNK_HEADER_SIZE);

	if (buffer_size > MAX_BUFFER_SIZE)
		throw FmtInvalidArgument("Buffer size {} is too large, must not exceed {}",
					 buffer_size, MAX_BUFFER_SIZE);
}

} // namespace Gelf

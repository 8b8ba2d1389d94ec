// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/format.h>

#include <compare>
#include <cstdint>
#include <string>

namespace Gelf {

/**
 * The address of a GELF server: a host name or numeric address and
 * a UDP port.
 */
struct Endpoint {
	std::string host;
	uint16_t port;

	auto operator<=>(const Endpoint &) const noexcept = default;
	bool operator==(const Endpoint &) const noexcept = default;
};

/**
 * Parse an endpoint in the form "HOST:PORT" or "[IPv6]:PORT".
 *
 * Throws std::invalid_argument on error.
 */
Endpoint
ParseEndpoint(const char *s);

} // namespace Gelf

template<>
struct fmt::formatter<Gelf::Endpoint> : formatter<string_view>
{
	template<typename FormatContext>
	auto format(const Gelf::Endpoint &endpoint, FormatContext &ctx) const {
		if (endpoint.host.find(':') != std::string::npos)
			/* IPv6 */
			return fmt::format_to(ctx.out(), "[{}]:{}",
					      endpoint.host, endpoint.port);

		return fmt::format_to(ctx.out(), "{}:{}",
				      endpoint.host, endpoint.port);
	}
};

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Resolver.hxx"
#include "AddressInfo.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <fmt/format.h>

#include <string>

#include <netdb.h>
#include <string.h>

AddressInfoList
Resolve(const char *host, unsigned port, const struct addrinfo *hints)
{
	/* strip the square brackets around an IPv6 address */
	std::string buffer;
	if (*host == '[') {
		const char *end = strchr(host, ']');
		if (end == nullptr || end[1] != 0)
			throw FmtRuntimeError("Malformed host name: '{}'", host);

		buffer.assign(host + 1, end);
		host = buffer.c_str();
	}

	const auto port_string = fmt::format_int(port);

	struct addrinfo *ai;
	int result = getaddrinfo(host, port_string.c_str(), hints, &ai);
	if (result != 0)
		throw FmtRuntimeError("Failed to resolve '{}': {}",
				      host, gai_strerror(result));

	return AddressInfoList(ai);
}

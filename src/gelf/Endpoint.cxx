// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Endpoint.hxx"
#include "net/HostParser.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <stdlib.h>

namespace Gelf {

Endpoint
ParseEndpoint(const char *s)
{
	const auto eh = ExtractHost(s);
	if (eh.HasFailed() || eh.host.empty())
		throw FmtInvalidArgument("Malformed server address: '{}'", s);

	if (*eh.end != ':')
		throw FmtInvalidArgument("Port number missing in '{}'", s);

	const char *port_string = eh.end + 1;
	char *endptr;
	const unsigned long port = strtoul(port_string, &endptr, 10);
	if (endptr == port_string || *endptr != 0 ||
	    port == 0 || port > 0xffff)
		throw FmtInvalidArgument("Malformed port number in '{}'", s);

	return {std::string{eh.host}, static_cast<uint16_t>(port)};
}

} // namespace Gelf

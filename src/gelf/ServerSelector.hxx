// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Endpoint.hxx"

#include <cassert>
#include <cstddef>
#include <span>

namespace Gelf {

/**
 * Picks servers from a fixed list in round-robin order, starting
 * with the first one.
 */
class ServerSelector {
	const std::span<const Endpoint> servers;

	std::size_t counter = 0;

public:
	/**
	 * @param _servers a non-empty list which must remain valid
	 * for the lifetime of this object
	 */
	explicit ServerSelector(std::span<const Endpoint> _servers) noexcept
		:servers(_servers)
	{
		assert(!servers.empty());
	}

	ServerSelector(const ServerSelector &) = delete;
	ServerSelector &operator=(const ServerSelector &) = delete;

	/**
	 * Returns the next server.  Call this once per message (not
	 * per chunk).
	 */
	const Endpoint &Next() noexcept {
		return servers[counter++ % servers.size()];
	}
};

} // namespace Gelf

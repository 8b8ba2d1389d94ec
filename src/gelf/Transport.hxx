// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "co/Task.hxx"

#include <cstddef>
#include <span>

namespace Gelf {

struct Endpoint;

/**
 * Sends datagrams to GELF servers.
 */
class DatagramTransport {
public:
	virtual ~DatagramTransport() noexcept = default;

	/**
	 * Send one datagram.  The data and the endpoint must remain
	 * valid until the task finishes.
	 *
	 * Throws on error.
	 *
	 * @return the number of bytes sent
	 */
	virtual Co::Task<std::size_t> Send(std::span<const std::byte> datagram,
					   const Endpoint &endpoint) = 0;

	/**
	 * Release all resources.  Subsequent Send() calls fail with
	 * #SocketDestroyedError.
	 */
	virtual void Close() noexcept = 0;
};

} // namespace Gelf

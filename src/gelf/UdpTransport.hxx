// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Transport.hxx"
#include "Endpoint.hxx"
#include "net/AllocatedSocketAddress.hxx"
#include "net/UniqueSocketDescriptor.hxx"

#include <map>

class EventLoop;

namespace Gelf {

/**
 * A #DatagramTransport implementation which sends IPv4 UDP
 * datagrams.  The socket is created on the first Send() call.
 */
class UdpTransport final : public DatagramTransport {
	EventLoop &event_loop;

	UniqueSocketDescriptor socket;

	/**
	 * Resolved server addresses.
	 */
	std::map<Endpoint, AllocatedSocketAddress> addresses;

	/**
	 * The number of Send() calls currently waiting for the socket.
	 * The socket is not closed before this drops to zero.
	 */
	unsigned pending = 0;

	bool closed = false;

public:
	explicit UdpTransport(EventLoop &_event_loop) noexcept
		:event_loop(_event_loop) {}

	auto &GetEventLoop() const noexcept {
		return event_loop;
	}

	/**
	 * Returns the socket, or SocketDescriptor::Undefined() if
	 * none was created yet.
	 */
	SocketDescriptor GetSocket() const noexcept {
		return socket;
	}

	bool IsClosed() const noexcept {
		return closed;
	}

	/* virtual methods from class DatagramTransport */
	Co::Task<std::size_t> Send(std::span<const std::byte> datagram,
				   const Endpoint &endpoint) override;
	void Close() noexcept override;

private:
	class PendingLease;

	SocketDescriptor GetOrCreateSocket();
	SocketAddress ResolveEndpoint(const Endpoint &endpoint);

	void Release() noexcept;
};

} // namespace Gelf

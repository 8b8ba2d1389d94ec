// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "UdpTransport.hxx"
#include "Error.hxx"
#include "event/AwaitableSocketEvent.hxx"
#include "net/AddressInfo.hxx"
#include "net/Resolver.hxx"
#include "lib/fmt/SocketError.hxx"

#include <sys/socket.h>
#include <netdb.h>

namespace Gelf {

/**
 * Marks a Send() call which uses the socket.
 */
class UdpTransport::PendingLease {
	UdpTransport &transport;

public:
	explicit PendingLease(UdpTransport &_transport) noexcept
		:transport(_transport)
	{
		++transport.pending;
	}

	~PendingLease() noexcept {
		if (--transport.pending == 0 && transport.closed)
			transport.Release();
	}

	PendingLease(const PendingLease &) = delete;
	PendingLease &operator=(const PendingLease &) = delete;
};

SocketDescriptor
UdpTransport::GetOrCreateSocket()
{
	if (!socket.IsDefined() &&
	    !socket.CreateNonBlock(AF_INET, SOCK_DGRAM, 0))
		throw MakeSocketError("Failed to create UDP socket");

	return socket;
}

SocketAddress
UdpTransport::ResolveEndpoint(const Endpoint &endpoint)
{
	if (auto i = addresses.find(endpoint); i != addresses.end())
		return i->second;

	static constexpr struct addrinfo hints{
		.ai_flags = AI_NUMERICSERV,
		.ai_family = AF_INET,
		.ai_socktype = SOCK_DGRAM,
	};

	const auto ai = Resolve(endpoint.host.c_str(), endpoint.port, &hints);
	return addresses.emplace(endpoint, AllocatedSocketAddress{ai.front()})
		.first->second;
}

Co::Task<std::size_t>
UdpTransport::Send(std::span<const std::byte> datagram,
		   const Endpoint &endpoint)
{
	if (closed)
		throw SocketDestroyedError{};

	const SocketDescriptor s = GetOrCreateSocket();
	const SocketAddress address = ResolveEndpoint(endpoint);

	const PendingLease lease{*this};

	while (true) {
		co_await AwaitableSocketEvent{event_loop, s, SocketEvent::WRITE};

		const auto nbytes = s.WriteToNoWait(datagram, address);
		if (nbytes >= 0)
			co_return static_cast<std::size_t>(nbytes);

		if (const auto e = GetSocketError(); !IsSocketErrorSendWouldBlock(e))
			throw FmtSocketError(e, "Failed to send datagram to {}",
					     endpoint);
	}
}

void
UdpTransport::Close() noexcept
{
	closed = true;

	if (pending == 0)
		Release();
}

void
UdpTransport::Release() noexcept
{
	socket.Close();
	addresses.clear();
}

} // namespace Gelf

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Util.hxx"
#include "gelf/Client.hxx"
#include "gelf/Error.hxx"
#include "gelf/UdpTransport.hxx"
#include "event/Loop.hxx"
#include "net/AddressInfo.hxx"
#include "net/AllocatedSocketAddress.hxx"
#include "net/Resolver.hxx"
#include "net/UniqueSocketDescriptor.hxx"

#include <gtest/gtest.h>

#include <array>
#include <stdexcept>

#include <netdb.h>
#include <sys/socket.h>

namespace {

/**
 * A non-blocking UDP socket bound to a random port on the IPv4
 * loopback address.
 */
struct Receiver {
	UniqueSocketDescriptor socket;
	uint16_t port;

	Receiver() {
		static constexpr struct addrinfo hints{
			.ai_flags = AI_NUMERICHOST,
			.ai_family = AF_INET,
			.ai_socktype = SOCK_DGRAM,
		};

		const auto ai = Resolve("127.0.0.1", 0, &hints);

		if (!socket.CreateNonBlock(AF_INET, SOCK_DGRAM, 0) ||
		    !socket.Bind(ai.front()))
			throw std::runtime_error("Failed to bind UDP socket");

		port = socket.GetLocalAddress().GetPort();
	}

	Gelf::Endpoint GetEndpoint() const noexcept {
		return {"127.0.0.1", port};
	}

	std::string Receive() {
		std::array<std::byte, 65536> buffer;
		const auto nbytes = socket.ReadNoWait(buffer);
		if (nbytes < 0)
			throw std::runtime_error("No datagram received");

		return std::string{ToStringView(std::span{buffer}.first(nbytes))};
	}
};

} // anonymous namespace

TEST(GelfUdpTransport, Send)
{
	EventLoop event_loop;
	Receiver receiver;
	Gelf::UdpTransport transport{event_loop};

	EXPECT_FALSE(transport.GetSocket().IsDefined());

	const std::string_view payload = "hello world";

	std::optional<std::size_t> result;
	auto invoke = StoreResult(transport.Send(std::as_bytes(std::span{payload}),
						 receiver.GetEndpoint()),
				  result);
	Completion completion;
	completion.Start(invoke);

	/* the socket becomes writable in the next event loop
	   iteration */
	event_loop.Run();

	ASSERT_TRUE(completion.done);
	ASSERT_FALSE(completion.error);
	ASSERT_TRUE(result);
	EXPECT_EQ(*result, payload.size());
	EXPECT_TRUE(transport.GetSocket().IsDefined());

	EXPECT_EQ(receiver.Receive(), payload);

	transport.Close();
	EXPECT_TRUE(transport.IsClosed());
	EXPECT_FALSE(transport.GetSocket().IsDefined());

	EXPECT_THROW(RunNow(transport.Send(std::as_bytes(std::span{payload}),
					   receiver.GetEndpoint())),
		     Gelf::SocketDestroyedError);
}

TEST(GelfUdpTransport, CloseWhilePending)
{
	EventLoop event_loop;
	Receiver receiver;
	Gelf::UdpTransport transport{event_loop};

	const std::string_view payload = "hello";

	std::optional<std::size_t> result;
	auto invoke = StoreResult(transport.Send(std::as_bytes(std::span{payload}),
						 receiver.GetEndpoint()),
				  result);
	Completion completion;
	completion.Start(invoke);
	ASSERT_FALSE(completion.done);

	/* the socket stays open until the pending datagram was
	   sent */
	transport.Close();
	EXPECT_TRUE(transport.GetSocket().IsDefined());

	event_loop.Run();

	ASSERT_TRUE(completion.done);
	ASSERT_FALSE(completion.error);
	EXPECT_FALSE(transport.GetSocket().IsDefined());
	EXPECT_EQ(receiver.Receive(), payload);
}

TEST(GelfUdpTransport, Client)
{
	EventLoop event_loop;
	Receiver receiver;

	Gelf::Config config;
	config.servers.push_back(receiver.GetEndpoint());
	config.hostname = "test-host";
	config.compression = Gelf::Compression::NEVER;

	Gelf::Client client{event_loop, std::move(config)};

	std::optional<std::size_t> log_result;
	auto log_invoke = StoreResult(client.Log(Gelf::Level::NOTICE, "hello"),
				      log_result);
	Completion log_completion;
	log_completion.Start(log_invoke);

	auto close_invoke = AwaitVoid(client.Close());
	Completion close_completion;
	close_completion.Start(close_invoke);

	event_loop.Run();

	ASSERT_TRUE(log_completion.done);
	ASSERT_FALSE(log_completion.error);
	ASSERT_TRUE(close_completion.done);
	ASSERT_FALSE(close_completion.error);
	EXPECT_TRUE(client.IsClosed());

	const auto j = nlohmann::json::parse(receiver.Receive());
	EXPECT_EQ(j["host"], "test-host");
	EXPECT_EQ(j["short_message"], "hello");
	EXPECT_EQ(j["level"], 5);
}

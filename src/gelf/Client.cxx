// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Client.hxx"
#include "Chunker.hxx"
#include "Error.hxx"
#include "UdpTransport.hxx"
#include "lib/zlib/Deflate.hxx"

#include <chrono>
#include <string>
#include <vector>

namespace Gelf {

static Config &&
CheckConfig(Config &&config)
{
	config.Check();
	return std::move(config);
}

Client::Client(EventLoop &event_loop, Config _config,
	       std::unique_ptr<DatagramTransport> _transport,
	       ClientErrorHandler *_error_handler)
	:logger("gelf"),
	 config(CheckConfig(std::move(_config))),
	 selector(config.servers),
	 transport(std::move(_transport)),
	 drain(event_loop, in_flight, BIND_THIS_METHOD(ReleaseTransport)),
	 error_handler(_error_handler)
{
}

Client::Client(EventLoop &event_loop, Config _config,
	       ClientErrorHandler *_error_handler)
	:Client(event_loop, std::move(_config),
		std::make_unique<UdpTransport>(event_loop),
		_error_handler)
{
}

Client::~Client() noexcept = default;

Record
Client::MakeRecord(Level level, Message message, Metadata metadata) const
{
	return Gelf::MakeRecord(config.hostname, config.facility, level,
				std::move(message), std::move(metadata),
				std::chrono::system_clock::now());
}

Co::Task<std::size_t>
Client::Log(Level level, Message message, Metadata metadata)
{
	co_return co_await Send(MakeRecord(level, std::move(message),
					   std::move(metadata)));
}

Co::Task<std::size_t>
Client::Send(Record record)
{
	const std::string json = Serialize(record);
	std::span<const std::byte> payload = std::as_bytes(std::span{json});

	std::vector<std::byte> compressed;
	if (config.compression == Compression::ALWAYS ||
	    (config.compression == Compression::OPTIMAL &&
	     payload.size() > config.buffer_size)) {
		compressed = Deflate(payload);
		logger.Fmt(5, "Compressed {} bytes to {} bytes",
			   payload.size(), compressed.size());
		payload = compressed;
	}

	const auto lease = in_flight.BeginMessage();
	co_return co_await SendPayload(payload);
}

Co::Task<std::optional<std::size_t>>
Client::LogSafe(Level level, Message message, Metadata metadata)
{
	std::exception_ptr error;

	try {
		co_return co_await Log(level, std::move(message),
				       std::move(metadata));
	} catch (...) {
		error = std::current_exception();
	}

	logger(3, "Failed to send log message: ", error);

	if (error_handler != nullptr)
		error_handler->OnGelfError(std::move(error));

	co_return std::nullopt;
}

Co::Task<void>
Client::Close()
{
	drain.RequestClose();
	co_await drain;
}

Co::Task<std::size_t>
Client::SendPayload(std::span<const std::byte> payload)
{
	/* this throws SizeExceededError before anything is sent */
	const std::size_t count = ChunkCount(payload.size(), config.buffer_size);
	if (count == 1)
		co_return co_await SendDatagram(payload, selector.Next());

	const MessageId id = GenerateMessageId();
	const Endpoint &endpoint = selector.Next();
	Chunker chunker{payload, config.buffer_size, id};

	logger.Fmt(5, "Sending {} bytes in {} chunks to {}",
		   payload.size(), count, endpoint);

	std::size_t total = 0;
	for (std::size_t i = 0; i < count; ++i)
		total += co_await SendDatagram(chunker.Build(i), endpoint);

	co_return total;
}

Co::Task<std::size_t>
Client::SendDatagram(std::span<const std::byte> datagram,
		     const Endpoint &endpoint)
{
	if (drain.IsClosed())
		throw SocketDestroyedError{};

	const auto lease = in_flight.BeginChunk();
	co_return co_await transport->Send(datagram, endpoint);
}

void
Client::ReleaseTransport() noexcept
{
	transport->Close();
}

} // namespace Gelf

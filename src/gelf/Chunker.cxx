// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Chunker.hxx"
#include "Error.hxx"
#include "system/Urandom.hxx"

#include <fmt/format.h>

#include <algorithm>
#include <cassert>

namespace Gelf {

std::size_t
ChunkCount(std::size_t payload_size, std::size_t buffer_size)
{
	assert(buffer_size > CHUNK_HEADER_SIZE);

	if (payload_size <= buffer_size)
		return 1;

	const std::size_t chunk_payload_size = GetChunkPayloadSize(buffer_size);
	const std::size_t count = (payload_size + chunk_payload_size - 1) / chunk_payload_size;
	if (count > MAX_CHUNKS)
		throw SizeExceededError(fmt::format("Cannot log messages bigger than {} bytes",
						    GetMaxMessageSize(buffer_size)));

	return count;
}

MessageId
GenerateMessageId()
{
	MessageId id;
	UrandomFill(id);
	return id;
}

Chunker::Chunker(std::span<const std::byte> _payload,
		 std::size_t buffer_size, const MessageId &id)
	:payload(_payload),
	 chunk_payload_size(GetChunkPayloadSize(buffer_size)),
	 count(ChunkCount(payload.size(), buffer_size)),
	 buffer(buffer_size)
{
	auto &header = *reinterpret_cast<ChunkHeader *>(buffer.data());
	std::copy_n(CHUNK_MAGIC, sizeof(CHUNK_MAGIC), header.magic);
	header.id = id;
	header.sequence = 0;
	header.count = static_cast<uint8_t>(count);
}

std::span<const std::byte>
Chunker::Build(std::size_t sequence) noexcept
{
	assert(sequence < count);

	auto &header = *reinterpret_cast<ChunkHeader *>(buffer.data());
	header.sequence = static_cast<uint8_t>(sequence);

	const auto slice = payload.subspan(sequence * chunk_payload_size)
		.first(std::min(chunk_payload_size,
				payload.size() - sequence * chunk_payload_size));
	std::copy(slice.begin(), slice.end(),
		  buffer.begin() + CHUNK_HEADER_SIZE);

	return std::span{buffer}.first(CHUNK_HEADER_SIZE + slice.size());
}

} // namespace Gelf

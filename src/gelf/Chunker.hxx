// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Protocol.hxx"

#include <cstddef>
#include <span>
#include <vector>

namespace Gelf {

/**
 * The number of payload bytes which fit into one chunk.
 */
constexpr std::size_t
GetChunkPayloadSize(std::size_t buffer_size) noexcept
{
	return buffer_size - CHUNK_HEADER_SIZE;
}

/**
 * The largest payload which can be sent with the given buffer size.
 */
constexpr std::size_t
GetMaxMessageSize(std::size_t buffer_size) noexcept
{
	return GetChunkPayloadSize(buffer_size) * MAX_CHUNKS;
}

/**
 * Determine how many datagrams are needed for a payload of the given
 * size.  Returns 1 if the payload fits into one datagram; such a
 * payload is sent as-is, without a chunk header.
 *
 * Throws #SizeExceededError if more than #MAX_CHUNKS chunks would be
 * needed.
 *
 * @param buffer_size the maximum datagram size; must be larger than
 * #CHUNK_HEADER_SIZE
 */
std::size_t
ChunkCount(std::size_t payload_size, std::size_t buffer_size);

/**
 * Generate a new random message id.
 *
 * Throws on error.
 */
MessageId
GenerateMessageId();

/**
 * Splits a payload into chunks.  It owns one datagram buffer which
 * is reused for all chunks; the header fields which are the same for
 * all chunks are written only once.
 */
class Chunker {
	const std::span<const std::byte> payload;

	const std::size_t chunk_payload_size;

	const std::size_t count;

	std::vector<std::byte> buffer;

public:
	/**
	 * Throws #SizeExceededError if the payload is too large.
	 * Payloads which fit into one datagram are not meant to be
	 * chunked; see ChunkCount().
	 *
	 * @param _payload the payload which must remain valid for
	 * the lifetime of this object
	 */
	Chunker(std::span<const std::byte> _payload,
		std::size_t buffer_size, const MessageId &id);

	Chunker(const Chunker &) = delete;
	Chunker &operator=(const Chunker &) = delete;

	std::size_t size() const noexcept {
		return count;
	}

	/**
	 * Build the datagram for the given sequence number.  The
	 * returned span is only valid until the next Build() call.
	 */
	std::span<const std::byte> Build(std::size_t sequence) noexcept;
};

} // namespace Gelf

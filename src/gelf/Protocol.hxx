// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Definitions for the GELF (Graylog Extended Log Format) UDP
 * protocol and its chunking extension.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace Gelf {

/**
 * The maximum number of chunks one message may be split into.
 */
static constexpr std::size_t MAX_CHUNKS = 128;

/**
 * The default datagram size.  This fits into the MTU of most
 * networks.
 */
static constexpr std::size_t DEFAULT_BUFFER_SIZE = 1400;

/**
 * The largest payload of a UDP datagram over IPv4.
 */
static constexpr std::size_t MAX_BUFFER_SIZE = 65507;

static constexpr std::byte CHUNK_MAGIC[2]{std::byte{0x1e}, std::byte{0x0f}};

using MessageId = std::array<std::byte, 8>;

/**
 * The header which precedes the payload slice of each chunk.
 */
struct ChunkHeader {
	std::byte magic[2];

	/**
	 * A random value shared by all chunks of one message.
	 */
	MessageId id;

	/**
	 * Zero-based position of this chunk.
	 */
	uint8_t sequence;

	uint8_t count;
};

static_assert(sizeof(ChunkHeader) == 12);
static_assert(alignof(ChunkHeader) == 1);

static constexpr std::size_t CHUNK_HEADER_SIZE = sizeof(ChunkHeader);

/**
 * The GELF version emitted by this library.
 */
static constexpr char VERSION[] = "1.1";

} // namespace Gelf

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Endpoint.hxx"
#include "Protocol.hxx"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace Gelf {

enum class Compression : uint8_t {
	/**
	 * Compress only if the serialized record does not fit into
	 * one datagram.
	 */
	OPTIMAL,

	ALWAYS,
	NEVER,
};

[[gnu::const]]
std::string_view
ToString(Compression compression) noexcept;

/**
 * Parse "optimal", "always" or "never".
 *
 * Throws std::invalid_argument on error.
 */
Compression
ParseCompression(std::string_view s);

/**
 * Determine the name of this host with gethostname().
 *
 * Throws on error.
 */
std::string
GetLocalHostName();

struct Config {
	/**
	 * The servers which receive the messages, selected
	 * round-robin.  Must not be empty.
	 */
	std::vector<Endpoint> servers;

	/**
	 * The value of the "host" field.
	 */
	std::string hostname = GetLocalHostName();

	std::string facility = "C++";

	/**
	 * The maximum size of one datagram.  Larger payloads are
	 * chunked.
	 */
	std::size_t buffer_size = DEFAULT_BUFFER_SIZE;

	Compression compression = Compression::OPTIMAL;

	/**
	 * Throws std::invalid_argument if the configuration is not
	 * usable.
	 */
	void Check() const;
};

} // namespace Gelf

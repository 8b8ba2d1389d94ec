// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <string_view>

namespace Gelf {

/**
 * Syslog severity levels.
 */
enum class Level : uint8_t {
	/** system is unusable */
	EMERGENCY = 0,

	/** action must be taken immediately */
	ALERT = 1,

	CRITICAL = 2,
	ERROR = 3,
	WARNING = 4,

	/** normal, but significant, condition */
	NOTICE = 5,

	INFO = 6,
	DEBUG = 7,
};

[[gnu::const]]
std::string_view
ToString(Level level) noexcept;

/**
 * Parse a level name (e.g. "warning", "warn" or "4").
 *
 * Throws std::invalid_argument on error.
 */
Level
ParseLevel(std::string_view s);

} // namespace Gelf

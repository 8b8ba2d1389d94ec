// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Level.hxx"
#include "Protocol.hxx"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace Gelf {

/**
 * The value of an additional field.  Time points are sent as ISO
 * 8601 strings.
 */
using FieldValue = std::variant<std::string, int64_t, double,
				std::chrono::system_clock::time_point>;

struct AdditionalField {
	/**
	 * The name as it appears on the wire, i.e. including the
	 * leading underscore.
	 */
	std::string name;

	FieldValue value;
};

/**
 * A GELF payload.
 */
struct Record {
	std::string version = VERSION;
	std::string host;
	std::string short_message;
	std::optional<std::string> full_message;

	/**
	 * Seconds since the epoch with a millisecond fraction.
	 */
	double timestamp = 0;

	Level level = Level::INFO;

	std::optional<std::string> facility;

	std::vector<AdditionalField> additional;

	/**
	 * Add an additional field.  The leading underscore is
	 * prepended here; the reserved name "_id" becomes "__id".
	 */
	void AddField(std::string_view name, FieldValue value);

	[[gnu::pure]]
	const FieldValue *FindField(std::string_view wire_name) const noexcept;
};

/**
 * Convert a time point to a GELF timestamp.
 */
[[gnu::const]]
double
ToTimestamp(std::chrono::system_clock::time_point tp) noexcept;

/**
 * Convert an additional field name to its wire name.
 */
std::string
MakeWireFieldName(std::string_view name);

/**
 * Serialize the record to JSON.  The fields appear in declaration
 * order, followed by the additional fields in insertion order.
 */
std::string
Serialize(const Record &record);

} // namespace Gelf

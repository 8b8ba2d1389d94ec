// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Record.hxx"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Gelf {

/**
 * The message part of a log call: a text or an exception.
 */
class Message {
	std::string short_message;

	std::optional<std::string> full_message;

	/**
	 * Fields extracted from the message, with wire names.
	 */
	std::vector<AdditionalField> fields;

public:
	Message(const char *_text)
		:short_message(_text) {}

	Message(std::string_view _text)
		:short_message(_text) {}

	Message(std::string &&_text) noexcept
		:short_message(std::move(_text)) {}

	Message(const std::string &_text)
		:short_message(_text) {}

	/**
	 * Describe an exception.  The outermost message becomes the
	 * short message; if there are nested exceptions, the whole
	 * chain becomes the full message.  The source location of a
	 * #LocatedError is added as "_file" and "_line".
	 */
	Message(std::exception_ptr ep);

	/**
	 * Describe an arbitrary value by its JSON serialization.
	 */
	static Message FromJson(const nlohmann::json &j);

	/**
	 * Move the contents of this object into the given #Record.
	 */
	void ApplyTo(Record &record) &&;
};

/**
 * Optional attributes of a log call which override the defaults.
 */
struct Metadata {
	std::optional<std::string> facility;
	std::optional<std::string> full_message;
	std::optional<Level> level;
	std::optional<std::chrono::system_clock::time_point> timestamp;

	/**
	 * Additional fields with their plain names (without the
	 * leading underscore).
	 */
	std::vector<std::pair<std::string, FieldValue>> fields;

	Metadata &Add(std::string name, FieldValue value) {
		fields.emplace_back(std::move(name), std::move(value));
		return *this;
	}
};

/**
 * Assemble a #Record.
 *
 * @param host the value of the "host" field
 * @param facility the default facility
 * @param now the default timestamp
 */
Record
MakeRecord(std::string_view host, std::string_view facility,
	   Level level, Message &&message, Metadata &&metadata,
	   std::chrono::system_clock::time_point now);

} // namespace Gelf

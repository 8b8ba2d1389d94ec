// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Record.hxx"
#include "time/ISO8601.hxx"

#include <nlohmann/json.hpp>

using std::string_view_literals::operator""sv;

namespace Gelf {

void
Record::AddField(std::string_view name, FieldValue value)
{
	additional.push_back({MakeWireFieldName(name), std::move(value)});
}

const FieldValue *
Record::FindField(std::string_view wire_name) const noexcept
{
	for (const auto &i : additional)
		if (i.name == wire_name)
			return &i.value;

	return nullptr;
}

double
ToTimestamp(std::chrono::system_clock::time_point tp) noexcept
{
	const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch());
	return static_cast<double>(ms.count()) / 1000.;
}

std::string
MakeWireFieldName(std::string_view name)
{
	std::string result;
	result.reserve(name.size() + 2);
	result.push_back('_');
	result.append(name);

	/* GELF libraries should not send the "_id" field */
	if (result == "_id"sv)
		result.insert(result.begin(), '_');

	return result;
}

static nlohmann::ordered_json
ToJson(const FieldValue &value)
{
	return std::visit([](const auto &v) -> nlohmann::ordered_json {
		using T = std::decay_t<decltype(v)>;
		if constexpr (std::is_same_v<T, std::chrono::system_clock::time_point>)
			return FormatISO8601(v);
		else
			return v;
	}, value);
}

std::string
Serialize(const Record &record)
{
	nlohmann::ordered_json j{
		{"version", record.version},
		{"host", record.host},
		{"short_message", record.short_message},
	};

	if (record.full_message)
		j["full_message"] = *record.full_message;

	j["timestamp"] = record.timestamp;
	j["level"] = static_cast<unsigned>(record.level);

	if (record.facility)
		j["facility"] = *record.facility;

	for (const auto &i : record.additional)
		j[i.name] = ToJson(i.value);

	/* invalid UTF-8 sequences become U+FFFD */
	return j.dump(-1, ' ', false,
		      nlohmann::ordered_json::error_handler_t::replace);
}

} // namespace Gelf

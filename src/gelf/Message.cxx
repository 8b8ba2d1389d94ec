// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Message.hxx"
#include "Error.hxx"
#include "util/Exception.hxx"

#include <nlohmann/json.hpp>

namespace Gelf {

static std::string
GetOuterMessage(const std::exception_ptr &ep) noexcept
try {
	std::rethrow_exception(ep);
} catch (const std::exception &e) {
	return e.what();
} catch (...) {
	return "Unknown exception";
}

Message::Message(std::exception_ptr ep)
	:short_message(GetOuterMessage(ep))
{
	if (HasNested(ep))
		full_message = GetFullMessage(ep);

	if (const auto *located = FindNested<LocatedError>(ep)) {
		fields.push_back({"_file", std::string{located->GetFile()}});
		fields.push_back({"_line", int64_t(located->GetLine())});
	}
}

Message
Message::FromJson(const nlohmann::json &j)
{
	return Message{j.dump(-1, ' ', false,
			      nlohmann::json::error_handler_t::replace)};
}

void
Message::ApplyTo(Record &record) &&
{
	record.short_message = std::move(short_message);
	record.full_message = std::move(full_message);

	for (auto &i : fields)
		record.additional.push_back(std::move(i));
}

Record
MakeRecord(std::string_view host, std::string_view facility,
	   Level level, Message &&message, Metadata &&metadata,
	   std::chrono::system_clock::time_point now)
{
	Record record;
	record.host = host;
	record.facility = facility;
	record.level = metadata.level.value_or(level);
	record.timestamp = ToTimestamp(metadata.timestamp.value_or(now));

	std::move(message).ApplyTo(record);

	if (metadata.facility)
		record.facility = std::move(metadata.facility);

	if (metadata.full_message)
		record.full_message = std::move(metadata.full_message);

	for (auto &[name, value] : metadata.fields)
		record.AddField(name, std::move(value));

	return record;
}

} // namespace Gelf

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Level.hxx"
#include "lib/fmt/RuntimeError.hxx"

using std::string_view_literals::operator""sv;

namespace Gelf {

static constexpr struct {
	std::string_view name;
	Level level;
} level_names[] = {
	{ "emergency"sv, Level::EMERGENCY },
	{ "emerg"sv, Level::EMERGENCY },
	{ "alert"sv, Level::ALERT },
	{ "critical"sv, Level::CRITICAL },
	{ "crit"sv, Level::CRITICAL },
	{ "error"sv, Level::ERROR },
	{ "err"sv, Level::ERROR },
	{ "warning"sv, Level::WARNING },
	{ "warn"sv, Level::WARNING },
	{ "notice"sv, Level::NOTICE },
	{ "info"sv, Level::INFO },
	{ "debug"sv, Level::DEBUG },
};

std::string_view
ToString(Level level) noexcept
{
	switch (level) {
	case Level::EMERGENCY:
		return "emergency"sv;

	case Level::ALERT:
		return "alert"sv;

	case Level::CRITICAL:
		return "critical"sv;

	case Level::ERROR:
		return "error"sv;

	case Level::WARNING:
		return "warning"sv;

	case Level::NOTICE:
		return "notice"sv;

	case Level::INFO:
		return "info"sv;

	case Level::DEBUG:
		return "debug"sv;
	}

	return "unknown"sv;
}

Level
ParseLevel(std::string_view s)
{
	if (s.size() == 1 && s.front() >= '0' && s.front() <= '7')
		return static_cast<Level>(s.front() - '0');

	for (const auto &i : level_names)
		if (s == i.name)
			return i.level;

	throw FmtInvalidArgument("Unknown log level: '{}'", s);
}

} // namespace Gelf

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ISO8601.hxx"
#include "Convert.hxx"

#include <time.h>

std::string
FormatISO8601(const struct tm &tm)
{
	char buffer[64];
	strftime(buffer, sizeof(buffer), "%FT%TZ", &tm);
	return buffer;
}

std::string
FormatISO8601(std::chrono::system_clock::time_point tp)
{
	return FormatISO8601(GmTime(tp));
}

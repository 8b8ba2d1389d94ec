// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Convert.hxx"

#include <stdexcept>

struct tm
GmTime(std::chrono::system_clock::time_point tp)
{
	const time_t t = std::chrono::system_clock::to_time_t(tp);

	struct tm buffer;
	if (gmtime_r(&t, &buffer) == nullptr)
		throw std::runtime_error("gmtime_r() failed");

	return buffer;
}

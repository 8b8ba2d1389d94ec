// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <string>

struct tm;

std::string
FormatISO8601(const struct tm &tm);

/**
 * Format the given time point as an ISO 8601 UTC string with second
 * precision, e.g. "2024-01-31T12:34:56Z".
 */
std::string
FormatISO8601(std::chrono::system_clock::time_point tp);

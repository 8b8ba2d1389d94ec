// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>

#include <time.h>

/**
 * Convert a UTC-based time point to a UTC-based "struct tm".
 *
 * Throws on error.
 */
struct tm
GmTime(std::chrono::system_clock::time_point tp);

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <stdexcept>

class ZlibError : public std::runtime_error {
	int code;

public:
	explicit ZlibError(int _code, const char *_msg) noexcept
		:std::runtime_error(_msg), code(_code) {}

	int GetCode() const noexcept {
		return code;
	}
};

/**
 * Construct a #ZlibError with the zlib error string appended to the
 * given message.
 */
[[nodiscard]]
ZlibError
MakeZlibError(int code, const char *msg) noexcept;

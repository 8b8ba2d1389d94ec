// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Error.hxx"

#include <fmt/format.h>

#include <zlib.h>

ZlibError
MakeZlibError(int code, const char *msg) noexcept
{
	try {
		return ZlibError{code, fmt::format("{}: {}", msg, zError(code)).c_str()};
	} catch (...) {
		return ZlibError{code, msg};
	}
}

// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "SystemError.hxx"

#include <fmt/format.h>

std::system_error
VFmtErrno(int code, fmt::string_view format_str, fmt::format_args args) noexcept
{
	const std::error_code ec{code, std::system_category()};

	try {
		return std::system_error{ec, fmt::vformat(format_str, args)};
	} catch (...) {
		/* out of memory while formatting; fall back to a
		   message-less error */
		return std::system_error{ec};
	}
}

// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "SystemError.hxx"
#include "net/SocketError.hxx"

template<typename S, typename... Args>
[[nodiscard]] [[gnu::pure]]
std::system_error
FmtSocketError(socket_error_t code,
	       const S &format_str, Args&&... args) noexcept
{
	return VFmtErrno(code, format_str, fmt::make_format_args(args...));
}

template<typename S, typename... Args>
[[nodiscard]] [[gnu::pure]]
std::system_error
FmtSocketError(const S &format_str, Args&&... args) noexcept
{
	return FmtSocketError(GetSocketError(), format_str, std::forward<Args>(args)...);
}

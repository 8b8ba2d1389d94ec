// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "system/Error.hxx" // IWYU pragma: export

#include <errno.h>

using socket_error_t = int;

[[gnu::pure]]
static inline socket_error_t
GetSocketError() noexcept
{
	return errno;
}

[[gnu::const]]
static inline bool
IsSocketErrorSendWouldBlock(socket_error_t code) noexcept
{
	return code == EAGAIN || code == EWOULDBLOCK;
}

static inline std::system_error
MakeSocketError(socket_error_t code, const char *msg) noexcept
{
	return MakeErrno(code, msg);
}

static inline std::system_error
MakeSocketError(const char *msg) noexcept
{
	return MakeSocketError(GetSocketError(), msg);
}

// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <fmt/core.h>

#include <stdexcept> // IWYU pragma: export

template<typename S, typename... Args>
[[nodiscard]]
std::runtime_error
FmtRuntimeError(const S &format_str, Args&&... args)
{
	return std::runtime_error{fmt::vformat(format_str,
					       fmt::make_format_args(args...))};
}

template<typename S, typename... Args>
[[nodiscard]]
std::invalid_argument
FmtInvalidArgument(const S &format_str, Args&&... args)
{
	return std::invalid_argument{fmt::vformat(format_str,
						  fmt::make_format_args(args...))};
}

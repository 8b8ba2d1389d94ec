// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "../co/Completion.hxx"
#include "co/InvokeTask.hxx"
#include "co/Task.hxx"

#include <nlohmann/json.hpp>

#include <zlib.h>

#include <cstddef>
#include <optional>
#include <span>
#include <stdexcept>
#include <string_view>
#include <vector>

template<typename T>
Co::InvokeTask
StoreResult(Co::Task<T> task, std::optional<T> &result) noexcept
{
	result = co_await task;
}

inline Co::InvokeTask
AwaitVoid(Co::Task<void> task) noexcept
{
	co_await task;
}

/**
 * Run a task which is expected to finish without suspending and
 * return its result.  Rethrows its exception.
 */
template<typename T>
T
RunNow(Co::Task<T> task)
{
	std::optional<T> result;
	auto invoke = StoreResult(std::move(task), result);

	Completion c;
	c.Start(invoke);
	if (!c.done)
		throw std::logic_error("Task was suspended");

	if (c.error)
		std::rethrow_exception(c.error);

	return std::move(*result);
}

inline void
RunNow(Co::Task<void> task)
{
	auto invoke = AwaitVoid(std::move(task));

	Completion c;
	c.Start(invoke);
	if (!c.done)
		throw std::logic_error("Task was suspended");

	if (c.error)
		std::rethrow_exception(c.error);
}

inline std::string_view
ToStringView(std::span<const std::byte> s) noexcept
{
	return {reinterpret_cast<const char *>(s.data()), s.size()};
}

inline nlohmann::json
ParseJson(std::span<const std::byte> s)
{
	return nlohmann::json::parse(ToStringView(s));
}

/**
 * Decompress a zlib stream.
 */
inline std::vector<std::byte>
Inflate(std::span<const std::byte> src)
{
	std::vector<std::byte> dest(1024 * 1024);
	uLongf dest_length = dest.size();
	if (uncompress(reinterpret_cast<Bytef *>(dest.data()), &dest_length,
		       reinterpret_cast<const Bytef *>(src.data()),
		       src.size()) != Z_OK)
		throw std::runtime_error("uncompress() failed");

	dest.resize(dest_length);
	return dest;
}

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Logger.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>

#include <boost/container/static_vector.hpp>

#include <sys/uio.h>
#include <unistd.h>

unsigned LoggerDetail::max_level = 1;

LoggerDetail::ParamWrapper<std::exception_ptr>::ParamWrapper(std::exception_ptr ep) noexcept
	:ParamWrapper<std::string>(GetFullMessage(std::move(ep))) {}

static struct iovec
MakeIovec(std::string_view s) noexcept
{
	return {const_cast<char *>(s.data()), s.size()};
}

void
LoggerDetail::WriteV(std::string_view domain,
		     std::span<const std::string_view> buffers) noexcept
{
	boost::container::static_vector<struct iovec, 64> v;

	if (!domain.empty()) {
		v.push_back(MakeIovec("["));
		v.push_back(MakeIovec(domain));
		v.push_back(MakeIovec("] "));
	}

	for (const auto i : buffers) {
		if (v.size() >= v.capacity() - 1)
			break;

		v.push_back(MakeIovec(i));
	}

	v.push_back(MakeIovec("\n"));

	ssize_t nbytes =
		writev(STDERR_FILENO, v.data(), v.size());
	(void)nbytes;
}

void
LoggerDetail::Fmt(unsigned level, std::string_view domain,
		  fmt::string_view format_str, fmt::format_args args) noexcept
try {
	if (!CheckLevel(level))
		return;

	fmt::memory_buffer buffer;
	fmt::vformat_to(std::back_inserter(buffer), format_str, args);

	const std::string_view s[]{{buffer.data(), buffer.size()}};
	WriteV(domain, s);
} catch (...) {
	/* formatting failed (out of memory or a bad format
	   string); there is nobody we could report this to */
}

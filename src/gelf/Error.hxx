// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <source_location>
#include <stdexcept>

namespace Gelf {

/**
 * The message is too large to be sent, even with chunking.
 */
class SizeExceededError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * Client::Close() was called more than once.
 */
class AlreadyClosingError : public std::logic_error {
public:
	AlreadyClosingError()
		:std::logic_error("Close was already called once") {}
};

/**
 * The transport has already been released by Client::Close() or
 * Client::Destroy().
 */
class SocketDestroyedError : public std::runtime_error {
public:
	SocketDestroyedError()
		:std::runtime_error("Socket was already destroyed") {}
};

/**
 * An exception which knows the source location where it was
 * constructed.  When such an exception (or a nested one) is logged,
 * the location is sent in the additional fields "_file" and "_line".
 */
class LocatedError : public std::runtime_error {
	std::source_location location;

public:
	explicit LocatedError(const char *_msg,
			      std::source_location _location=std::source_location::current())
		:std::runtime_error(_msg), location(_location) {}

	explicit LocatedError(const std::string &_msg,
			      std::source_location _location=std::source_location::current())
		:std::runtime_error(_msg), location(_location) {}

	const char *GetFile() const noexcept {
		return location.file_name();
	}

	unsigned GetLine() const noexcept {
		return location.line();
	}
};

} // namespace Gelf

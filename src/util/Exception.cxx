// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Exception.hxx"

static std::string
GetFullMessage(const std::exception &e, const char *fallback,
	       const char *separator) noexcept
{
	std::string result = e.what();

	try {
		std::rethrow_if_nested(e);
	} catch (const std::exception &nested) {
		result += separator;
		result += GetFullMessage(nested, fallback, separator);
	} catch (...) {
		result += separator;
		result += fallback;
	}

	return result;
}

std::string
GetFullMessage(std::exception_ptr ep,
	       const char *fallback, const char *separator) noexcept
{
	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		return GetFullMessage(e, fallback, separator);
	} catch (const char *s) {
		return s;
	} catch (...) {
	}

	return fallback;
}

bool
HasNested(std::exception_ptr ep) noexcept
{
	try {
		std::rethrow_exception(ep);
	} catch (const std::nested_exception &ne) {
		return ne.nested_ptr() != nullptr;
	} catch (...) {
	}

	return false;
}

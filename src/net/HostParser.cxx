// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "HostParser.hxx"
#include "util/CharUtil.hxx"

#include <string.h>

static constexpr bool
IsValidHostnameChar(char ch) noexcept
{
	return IsAlphaNumericASCII(ch) ||
		ch == '-' || ch == '.' || ch == '_';
}

static constexpr bool
IsValidIPv6Char(char ch) noexcept
{
	return IsDigitASCII(ch) ||
		(ch >= 'a' && ch <= 'f') ||
		(ch >= 'A' && ch <= 'F') ||
		ch == ':';
}

static constexpr bool
IsValidScopeChar(char ch) noexcept
{
	return IsAlphaNumericASCII(ch) || ch == '-' || ch == '_';
}

static const char *
FindIPv6End(const char *p) noexcept
{
	while (IsValidIPv6Char(*p))
		++p;

	/* optional scope id, e.g. "%eth0" */
	if (*p == '%' && IsValidScopeChar(p[1])) {
		++p;
		while (IsValidScopeChar(*p))
			++p;
	}

	return p;
}

ExtractHostResult
ExtractHost(const char *src) noexcept
{
	ExtractHostResult result{{}, src};

	if (IsValidHostnameChar(*src)) {
		const char *colon = nullptr;

		const char *hostname = src++;

		while (IsValidHostnameChar(*src) || *src == ':') {
			if (*src == ':') {
				if (colon != nullptr) {
					/* found a second colon: assume it's an IPv6
					   address */
					result.end = FindIPv6End(src + 1);
					result.host = {hostname, result.end};
					return result;
				} else
					/* remember the position of the first colon */
					colon = src;
			}

			++src;
		}

		if (colon != nullptr)
			/* hostname ends at colon */
			src = colon;

		result.end = src;
		result.host = {hostname, result.end};
	} else if (src[0] == ':' && src[1] == ':') {
		/* IPv6 address beginning with "::" */
		result.end = FindIPv6End(src + 2);
		result.host = {src, result.end};
	} else if (src[0] == '[') {
		/* "[hostname]:port" (IPv6?) */

		const char *hostname = ++src;
		const char *end = strchr(hostname, ']');
		if (end == nullptr || end == hostname)
			/* failed */
			return result;

		result.host = {hostname, end};
		result.end = end + 1;
	}

	return result;
}

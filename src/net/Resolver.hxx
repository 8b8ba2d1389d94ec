// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

class AddressInfoList;
struct addrinfo;

/**
 * Thin wrapper for getaddrinfo() which throws on error.
 *
 * @param host the host name or numeric address; IPv6 addresses may
 * be enclosed in square brackets
 * @param port the port number
 */
AddressInfoList
Resolve(const char *host, unsigned port, const struct addrinfo *hints);

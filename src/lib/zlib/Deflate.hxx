// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>
#include <vector>

/**
 * Compress the given buffer into a zlib stream (RFC 1950) with the
 * default compression level.
 *
 * Throws #ZlibError on error.
 */
std::vector<std::byte>
Deflate(std::span<const std::byte> src);

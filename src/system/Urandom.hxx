// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstddef>
#include <span>

/**
 * Fill the given buffer with pseudo-random data from getrandom().
 * May block until the kernel's entropy pool is initialized.
 *
 * Throws on error.
 */
void
UrandomFill(std::span<std::byte> dest);

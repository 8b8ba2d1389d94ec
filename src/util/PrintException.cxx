// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "PrintException.hxx"
#include "Exception.hxx"

#include <stdio.h>

void
PrintException(std::exception_ptr ep) noexcept
{
	fprintf(stderr, "%s\n", GetFullMessage(ep).c_str());
}

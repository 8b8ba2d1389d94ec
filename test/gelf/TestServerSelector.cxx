// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "gelf/ServerSelector.hxx"

#include <gtest/gtest.h>

TEST(GelfServerSelector, Single)
{
	const Gelf::Endpoint servers[]{{"localhost", 12201}};
	Gelf::ServerSelector selector{servers};

	for (unsigned i = 0; i < 4; ++i)
		EXPECT_EQ(&selector.Next(), &servers[0]);
}

TEST(GelfServerSelector, RoundRobin)
{
	const Gelf::Endpoint servers[]{
		{"a", 1},
		{"b", 2},
		{"c", 3},
	};

	Gelf::ServerSelector selector{servers};

	EXPECT_EQ(selector.Next().host, "a");
	EXPECT_EQ(selector.Next().host, "b");
	EXPECT_EQ(selector.Next().host, "c");
	EXPECT_EQ(selector.Next().host, "a");
	EXPECT_EQ(selector.Next().host, "b");
}

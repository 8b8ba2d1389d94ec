// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "net/HostParser.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

TEST(HostParser, Name)
{
	const auto input = "graylog.example.com";
	const auto eh = ExtractHost(input);
	ASSERT_FALSE(eh.HasFailed());
	EXPECT_EQ(eh.host, "graylog.example.com"sv);
	EXPECT_EQ(*eh.end, 0);
}

TEST(HostParser, NamePort)
{
	const auto input = "gelf_01:12201";
	const auto eh = ExtractHost(input);
	ASSERT_FALSE(eh.HasFailed());
	EXPECT_EQ(eh.host, "gelf_01"sv);
	EXPECT_EQ(eh.end, input + 7);
}

TEST(HostParser, IPv4Port)
{
	const auto input = "127.0.0.1:12201";
	const auto eh = ExtractHost(input);
	ASSERT_FALSE(eh.HasFailed());
	EXPECT_EQ(eh.host.data(), input);
	EXPECT_EQ(eh.host.size(), 9u);
	EXPECT_EQ(eh.end, input + 9);
}

TEST(HostParser, IPv6)
{
	const auto input = "::1";
	const auto eh = ExtractHost(input);
	ASSERT_FALSE(eh.HasFailed());
	EXPECT_EQ(eh.host, "::1"sv);
	EXPECT_EQ(*eh.end, 0);
}

TEST(HostParser, IPv6Port)
{
	const auto input = "[2001:affe::]:12201";
	const auto eh = ExtractHost(input);
	ASSERT_FALSE(eh.HasFailed());
	EXPECT_EQ(eh.host.data(), input + 1);
	EXPECT_EQ(eh.host, "2001:affe::"sv);
	EXPECT_EQ(eh.end, input + 13);
}

TEST(HostParser, IPv6Scope)
{
	const auto input = "[fe80::1%eth0]:12201";
	const auto eh = ExtractHost(input);
	ASSERT_FALSE(eh.HasFailed());
	EXPECT_EQ(eh.host, "fe80::1%eth0"sv);
	EXPECT_EQ(*eh.end, ':');
}

TEST(HostParser, Malformed)
{
	EXPECT_TRUE(ExtractHost("").HasFailed());
	EXPECT_TRUE(ExtractHost("[]:80").HasFailed());
	EXPECT_TRUE(ExtractHost("[::1").HasFailed());
	EXPECT_TRUE(ExtractHost("/foo").HasFailed());
}

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <system_error>

static std::exception_ptr
MakeNested()
{
	try {
		try {
			throw std::invalid_argument("Inner");
		} catch (...) {
			std::throw_with_nested(std::runtime_error("Outer"));
		}
	} catch (...) {
		return std::current_exception();
	}

	return {};
}

TEST(ExceptionTest, RuntimeError)
{
	EXPECT_EQ(GetFullMessage(std::make_exception_ptr(std::runtime_error("Foo"))), "Foo");
}

TEST(ExceptionTest, DerivedError)
{
	class DerivedError : public std::runtime_error {
	public:
		explicit DerivedError(const char *_msg)
			:std::runtime_error(_msg) {}
	};

	EXPECT_EQ(GetFullMessage(std::make_exception_ptr(DerivedError("Foo"))), "Foo");
}

TEST(ExceptionTest, Nested)
{
	const auto ep = MakeNested();
	EXPECT_EQ(GetFullMessage(ep), "Outer; Inner");
	EXPECT_EQ(GetFullMessage(ep, "?", " / "), "Outer / Inner");
	EXPECT_TRUE(HasNested(ep));
}

TEST(ExceptionTest, NotNested)
{
	EXPECT_FALSE(HasNested(std::make_exception_ptr(std::runtime_error("Foo"))));
}

TEST(ExceptionTest, Unknown)
{
	EXPECT_EQ(GetFullMessage(std::make_exception_ptr(42)), "Unknown exception");
	EXPECT_EQ(GetFullMessage(std::make_exception_ptr(42), "Fallback"), "Fallback");
}

TEST(ExceptionTest, FindNested)
{
	const auto ep = MakeNested();

	const auto *inner = FindNested<std::invalid_argument>(ep);
	ASSERT_NE(inner, nullptr);
	EXPECT_STREQ(inner->what(), "Inner");

	EXPECT_EQ(FindNested<std::system_error>(ep), nullptr);
}

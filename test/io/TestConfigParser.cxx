// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "io/config/ConfigParser.hxx"
#include "io/config/LineParser.hxx"

#include <gtest/gtest.h>

#include <string>
#include <vector>

class MyConfigParser final
	: public ConfigParser, public std::vector<std::string> {
public:
	bool finished = false;

	void ParseLine(LineParser &line) override {
		const char *value = line.NextUnescape();
		if (value == nullptr)
			throw LineParser::Error("Quoted value expected");
		line.ExpectEnd();
		emplace_back(value);
	}

	void Finish() override {
		finished = true;
	}
};

static void
ParseLines(ConfigParser &parser, const char *const*lines)
{
	while (*lines != nullptr) {
		std::string line{*lines++};

		LineParser line_parser(line.data());
		if (!parser.PreParseLine(line_parser))
			parser.ParseLine(line_parser);
	}

	parser.Finish();
}

TEST(ConfigParser, Comments)
{
	static constexpr const char *lines[] = {
		"# comment",
		"",
		"   ",
		"'foo'",
		"  \"bar\"  ",
		"\t# indented comment",
		"'a\\'b'",
		nullptr
	};

	MyConfigParser parser;
	CommentConfigParser comment_parser{parser};
	ParseLines(comment_parser, lines);

	ASSERT_EQ(parser.size(), 3u);
	EXPECT_EQ(parser[0], "foo");
	EXPECT_EQ(parser[1], "bar");
	EXPECT_EQ(parser[2], "a'b");
	EXPECT_TRUE(parser.finished);
}

TEST(ConfigParser, Garbage)
{
	static constexpr const char *lines[] = {
		"'foo' bar",
		nullptr
	};

	MyConfigParser parser;
	CommentConfigParser comment_parser{parser};
	EXPECT_THROW(ParseLines(comment_parser, lines), LineParser::Error);
}

TEST(LineParser, Values)
{
	std::string line = "  server 127.0.0.1:12201 'quoted value' 42 [::1]:80  ";
	LineParser p{line.data()};

	EXPECT_TRUE(p.SkipWord("server"));
	EXPECT_STREQ(p.ExpectValue(), "127.0.0.1:12201");
	EXPECT_STREQ(p.NextValue(), "quoted value");
	EXPECT_EQ(p.NextPositiveInteger(), 42u);
	EXPECT_STREQ(p.ExpectValueAndEnd(), "[::1]:80");
	EXPECT_TRUE(p.IsEnd());
}

TEST(LineParser, SkipWord)
{
	std::string line = "servers foo";
	LineParser p{line.data()};

	EXPECT_FALSE(p.SkipWord("server"));
	EXPECT_STREQ(p.ExpectWord(), "servers");
	EXPECT_FALSE(p.IsEnd());
	EXPECT_THROW(p.ExpectEnd(), LineParser::Error);
}

TEST(LineParser, PositiveInteger)
{
	std::string line = "0";
	LineParser p{line.data()};
	EXPECT_THROW(p.NextPositiveInteger(), LineParser::Error);

	line = "12x";
	LineParser q{line.data()};
	EXPECT_THROW(q.NextPositiveInteger(), LineParser::Error);

	line = "-5";
	LineParser r{line.data()};
	EXPECT_THROW(r.NextPositiveInteger(), LineParser::Error);

	line = "+5";
	LineParser s{line.data()};
	EXPECT_THROW(s.NextPositiveInteger(), LineParser::Error);

	line = "99999999999999999999";
	LineParser t{line.data()};
	EXPECT_THROW(t.NextPositiveInteger(), LineParser::Error);
}

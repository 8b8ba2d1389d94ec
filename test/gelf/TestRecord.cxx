// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "gelf/Message.hxx"
#include "gelf/Error.hxx"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <string_view>

using std::string_view_literals::operator""sv;

static constexpr std::chrono::system_clock::time_point
MakeTimePoint(int64_t ms) noexcept
{
	return std::chrono::system_clock::time_point{std::chrono::milliseconds{ms}};
}

TEST(GelfRecord, WireFieldName)
{
	EXPECT_EQ(Gelf::MakeWireFieldName("foo"), "_foo");
	EXPECT_EQ(Gelf::MakeWireFieldName("id"), "__id");
	EXPECT_EQ(Gelf::MakeWireFieldName("_id"), "__id");
	EXPECT_EQ(Gelf::MakeWireFieldName("idx"), "_idx");
}

TEST(GelfRecord, Timestamp)
{
	EXPECT_DOUBLE_EQ(Gelf::ToTimestamp(MakeTimePoint(1349875231619)),
			 1349875231.619);
	EXPECT_DOUBLE_EQ(Gelf::ToTimestamp(MakeTimePoint(0)), 0);

	/* sub-millisecond precision is discarded */
	EXPECT_DOUBLE_EQ(Gelf::ToTimestamp(MakeTimePoint(1500) + std::chrono::microseconds{999}),
			 1.5);
}

TEST(GelfRecord, Serialize)
{
	Gelf::Record record;
	record.host = "example.org";
	record.short_message = "A short message";
	record.full_message = "Backtrace here\n\nmore stuff";
	record.timestamp = 1385053862.3072;
	record.level = Gelf::Level::ALERT;
	record.facility = "test";
	record.AddField("user_id", int64_t{9001});
	record.AddField("some_info", "foo");
	record.AddField("ratio", 0.25);
	record.AddField("id", "bar");

	EXPECT_EQ(Gelf::Serialize(record),
		  R"({"version":"1.1","host":"example.org","short_message":"A short message","full_message":"Backtrace here\n\nmore stuff","timestamp":1385053862.3072,"level":1,"facility":"test","_user_id":9001,"_some_info":"foo","_ratio":0.25,"__id":"bar"})"sv);
}

TEST(GelfRecord, SerializeMinimal)
{
	Gelf::Record record;
	record.host = "h";
	record.short_message = "m";

	EXPECT_EQ(Gelf::Serialize(record),
		  R"({"version":"1.1","host":"h","short_message":"m","timestamp":0.0,"level":6})"sv);
}

TEST(GelfRecord, TimeField)
{
	Gelf::Record record;
	record.AddField("when", MakeTimePoint(1349875231619));

	const auto j = nlohmann::json::parse(Gelf::Serialize(record));
	EXPECT_EQ(j["_when"], "2012-10-10T13:20:31Z");
}

TEST(GelfRecord, FindField)
{
	Gelf::Record record;
	record.AddField("foo", int64_t{42});

	EXPECT_EQ(record.FindField("foo"), nullptr);

	const auto *value = record.FindField("_foo");
	ASSERT_NE(value, nullptr);
	EXPECT_EQ(std::get<int64_t>(*value), 42);
}

TEST(GelfRecord, MakeRecord)
{
	const auto now = MakeTimePoint(1349875231619);

	const auto record = Gelf::MakeRecord("host", "facility",
					     Gelf::Level::WARNING,
					     "hello", {}, now);

	EXPECT_EQ(record.version, "1.1");
	EXPECT_EQ(record.host, "host");
	EXPECT_EQ(record.short_message, "hello");
	EXPECT_FALSE(record.full_message);
	EXPECT_DOUBLE_EQ(record.timestamp, 1349875231.619);
	EXPECT_EQ(record.level, Gelf::Level::WARNING);
	EXPECT_EQ(record.facility, "facility");
	EXPECT_TRUE(record.additional.empty());
}

TEST(GelfRecord, MakeRecordMetadata)
{
	Gelf::Metadata metadata;
	metadata.facility = "other";
	metadata.full_message = "full";
	metadata.level = Gelf::Level::EMERGENCY;
	metadata.timestamp = MakeTimePoint(1000);
	metadata.Add("id", int64_t{1}).Add("name", "value");

	const auto record = Gelf::MakeRecord("host", "facility",
					     Gelf::Level::DEBUG,
					     "hello", std::move(metadata),
					     MakeTimePoint(2000));

	EXPECT_EQ(record.facility, "other");
	EXPECT_EQ(record.full_message, "full");

	/* level 0 is a valid override */
	EXPECT_EQ(record.level, Gelf::Level::EMERGENCY);

	EXPECT_DOUBLE_EQ(record.timestamp, 1.0);

	ASSERT_EQ(record.additional.size(), 2u);
	EXPECT_EQ(record.additional[0].name, "__id");
	EXPECT_EQ(record.additional[1].name, "_name");
	EXPECT_EQ(std::get<std::string>(record.additional[1].value), "value");
}

TEST(GelfRecord, Exception)
{
	const auto record = Gelf::MakeRecord("host", "facility",
					     Gelf::Level::ERROR,
					     std::make_exception_ptr(std::runtime_error("Boom")),
					     {}, MakeTimePoint(0));

	EXPECT_EQ(record.short_message, "Boom");
	EXPECT_FALSE(record.full_message);
	EXPECT_TRUE(record.additional.empty());
}

TEST(GelfRecord, NestedException)
{
	std::exception_ptr ep;
	std::size_t line = 0;

	try {
		try {
			line = __LINE__ + 1;
			throw Gelf::LocatedError("Inner");
		} catch (...) {
			std::throw_with_nested(std::runtime_error("Outer"));
		}
	} catch (...) {
		ep = std::current_exception();
	}

	const auto record = Gelf::MakeRecord("host", "facility",
					     Gelf::Level::ERROR,
					     ep, {}, MakeTimePoint(0));

	EXPECT_EQ(record.short_message, "Outer");
	EXPECT_EQ(record.full_message, "Outer; Inner");

	const auto *file = record.FindField("_file");
	ASSERT_NE(file, nullptr);
	EXPECT_NE(std::get<std::string>(*file).find("TestRecord.cxx"),
		  std::string::npos);

	const auto *line_value = record.FindField("_line");
	ASSERT_NE(line_value, nullptr);
	EXPECT_EQ(std::get<int64_t>(*line_value), static_cast<int64_t>(line));
}

TEST(GelfRecord, FromJson)
{
	const nlohmann::json j{{"a", 1}, {"b", "c"}};

	const auto record = Gelf::MakeRecord("host", "facility",
					     Gelf::Level::INFO,
					     Gelf::Message::FromJson(j),
					     {}, MakeTimePoint(0));

	EXPECT_EQ(record.short_message, R"({"a":1,"b":"c"})");
}

TEST(GelfRecord, InvalidUtf8)
{
	Gelf::Record record;
	record.host = "h";
	record.short_message = "caf\xe9 \xff";
	record.AddField("file", "\xc3(");

	std::string s;
	EXPECT_NO_THROW(s = Gelf::Serialize(record));

	const auto j = nlohmann::json::parse(s);
	EXPECT_EQ(j["short_message"], "caf\xef\xbf\xbd \xef\xbf\xbd");
	EXPECT_EQ(j["_file"], "\xef\xbf\xbd(");
}

TEST(GelfRecord, FromJsonInvalidUtf8)
{
	const nlohmann::json j{{"path", "\xff"}};

	const auto record = Gelf::MakeRecord("host", "facility",
					     Gelf::Level::INFO,
					     Gelf::Message::FromJson(j),
					     {}, MakeTimePoint(0));

	EXPECT_EQ(record.short_message, "{\"path\":\"\xef\xbf\xbd\"}");
}

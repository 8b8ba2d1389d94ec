// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ConfigParser.hxx"
#include "LineParser.hxx"
#include "lib/fmt/SystemError.hxx"

#include <fmt/format.h>

#include <exception>
#include <memory>

#include <stdio.h>

using std::string_view_literals::operator""sv;

bool
ConfigParser::PreParseLine(LineParser &)
{
	return false;
}

bool
CommentConfigParser::PreParseLine(LineParser &line)
{
	if (child.PreParseLine(line))
		return true;

	if (line.front() == '#' || line.IsEnd())
		/* ignore empty lines and comments */
		return true;

	return ConfigParser::PreParseLine(line);
}

void
CommentConfigParser::ParseLine(LineParser &line)
{
	child.ParseLine(line);
}

void
CommentConfigParser::Finish()
{
	child.Finish();
	ConfigParser::Finish();
}

struct FileCloser {
	void operator()(FILE *file) const noexcept {
		fclose(file);
	}
};

void
ParseConfigFile(const std::filesystem::path &path, ConfigParser &parser)
{
	const std::unique_ptr<FILE, FileCloser> file{fopen(path.c_str(), "r")};
	if (!file)
		throw FmtErrno("Failed to open {}", path.native());

	char buffer[4096];
	unsigned i = 1;
	while (fgets(buffer, sizeof(buffer), file.get()) != nullptr) {
		LineParser line_parser(buffer);

		try {
			if (!parser.PreParseLine(line_parser))
				parser.ParseLine(line_parser);
		} catch (...) {
			std::throw_with_nested(LineParser::Error{fmt::format("{}:{}"sv,
									     path.native(), i)});
		}

		++i;
	}

	if (ferror(file.get()))
		throw FmtErrno("Failed to read {}", path.native());

	parser.Finish();
}

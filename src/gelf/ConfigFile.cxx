// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ConfigFile.hxx"
#include "Config.hxx"
#include "io/config/ConfigParser.hxx"
#include "io/config/LineParser.hxx"

using std::string_view_literals::operator""sv;

namespace Gelf {

class GelfConfigParser final : public ConfigParser {
	Config &config;

public:
	explicit GelfConfigParser(Config &_config) noexcept
		:config(_config) {}

	/* virtual methods from class ConfigParser */
	void ParseLine(LineParser &line) override;
};

void
GelfConfigParser::ParseLine(LineParser &line)
{
	const std::string_view word = line.ExpectWord();

	if (word == "server"sv) {
		config.servers.emplace_back(ParseEndpoint(line.ExpectValueAndEnd()));
	} else if (word == "hostname"sv) {
		config.hostname = line.ExpectValueAndEnd();
	} else if (word == "facility"sv) {
		config.facility = line.ExpectValueAndEnd();
	} else if (word == "buffer_size"sv) {
		config.buffer_size = line.NextPositiveInteger();
		line.ExpectEnd();
	} else if (word == "compression"sv) {
		config.compression = ParseCompression(line.ExpectValueAndEnd());
	} else
		throw LineParser::Error("Unknown option");
}

void
LoadConfigFile(Config &config, const std::filesystem::path &path)
{
	GelfConfigParser parser{config};
	CommentConfigParser comment_parser{parser};
	ParseConfigFile(path, comment_parser);
}

Config
LoadConfigFile(const std::filesystem::path &path)
{
	Config config;
	LoadConfigFile(config, path);
	config.Check();
	return config;
}

} // namespace Gelf

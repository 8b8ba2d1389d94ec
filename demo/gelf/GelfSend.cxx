// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "gelf/Client.hxx"
#include "gelf/ConfigFile.hxx"
#include "event/Loop.hxx"
#include "co/InvokeTask.hxx"
#include "io/Logger.hxx"
#include "util/PrintException.hxx"
#include "util/CharUtil.hxx"

#include <fmt/core.h>

#include <cstdlib>
#include <span>
#include <string_view>

#include <string.h>

struct Usage {};

struct CommandLine {
	Gelf::Config config;
	Gelf::Level level = Gelf::Level::INFO;
	Gelf::Metadata metadata;
	const char *message;
	unsigned verbose = 1;
};

static const char *
NextArgument(std::span<const char *const> &args)
{
	if (args.empty())
		throw Usage{};

	const char *value = args.front();
	args = args.subspan(1);
	return value;
}

static std::size_t
ParseBufferSize(const char *s)
{
	/* Config::Check() enforces the upper bound */
	if (!IsDigitASCII(*s))
		throw std::invalid_argument("Malformed buffer size");

	char *endptr;
	const unsigned long value = strtoul(s, &endptr, 10);
	if (endptr == s || *endptr != 0 || value == 0)
		throw std::invalid_argument("Malformed buffer size");

	return value;
}

static void
ParseField(Gelf::Metadata &metadata, const char *s)
{
	const char *eq = strchr(s, '=');
	if (eq == nullptr || eq == s)
		throw std::invalid_argument("Field must be NAME=VALUE");

	metadata.Add(std::string{s, eq}, std::string{eq + 1});
}

static CommandLine
ParseCommandLine(std::span<const char *const> args)
{
	CommandLine cmdline;

	/* the configuration file is loaded first so the other options
	   can override its settings */
	for (std::size_t i = 0; i + 1 < args.size(); ++i) {
		if (strcmp(args[i], "-c") == 0) {
			Gelf::LoadConfigFile(cmdline.config, args[i + 1]);
			break;
		}
	}

	while (!args.empty() && args.front()[0] == '-') {
		const std::string_view option = NextArgument(args);

		if (option == "-c")
			NextArgument(args);
		else if (option == "-s")
			cmdline.config.servers.emplace_back(Gelf::ParseEndpoint(NextArgument(args)));
		else if (option == "-l")
			cmdline.level = Gelf::ParseLevel(NextArgument(args));
		else if (option == "-f")
			cmdline.config.facility = NextArgument(args);
		else if (option == "-H")
			cmdline.config.hostname = NextArgument(args);
		else if (option == "-b")
			cmdline.config.buffer_size = ParseBufferSize(NextArgument(args));
		else if (option == "-z")
			cmdline.config.compression = Gelf::ParseCompression(NextArgument(args));
		else if (option == "-v")
			++cmdline.verbose;
		else if (option == "-F")
			ParseField(cmdline.metadata, NextArgument(args));
		else
			throw Usage{};
	}

	cmdline.message = NextArgument(args);
	if (!args.empty())
		throw Usage{};

	cmdline.config.Check();
	return cmdline;
}

struct Instance final {
	EventLoop event_loop;

	std::exception_ptr error;

	void OnCompletion(std::exception_ptr _error) noexcept {
		error = std::move(_error);
	}
};

static Co::InvokeTask
Run(Gelf::Client &client, CommandLine &cmdline)
{
	const std::size_t nbytes =
		co_await client.Log(cmdline.level, cmdline.message,
				    std::move(cmdline.metadata));

	co_await client.Close();

	fmt::print(stderr, "Sent {} bytes\n", nbytes);
}

int
main(int argc, char **argv) noexcept
try {
	auto cmdline = ParseCommandLine({argv + 1, static_cast<std::size_t>(argc - 1)});
	SetLogLevel(cmdline.verbose);

	Instance instance;
	Gelf::Client client{instance.event_loop, std::move(cmdline.config)};

	auto task = Run(client, cmdline);
	task.Start(BIND_METHOD(instance, &Instance::OnCompletion));

	instance.event_loop.Run();

	if (instance.error)
		std::rethrow_exception(instance.error);

	return EXIT_SUCCESS;
} catch (Usage) {
	fmt::print(stderr, "Usage: gelf-send [-c FILE] [-s HOST:PORT]... [-l LEVEL] [-f FACILITY]\n"
		   "    [-H HOSTNAME] [-b SIZE] [-z optimal|always|never] [-v]\n"
		   "    [-F NAME=VALUE]... MESSAGE\n");
	return EXIT_FAILURE;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}

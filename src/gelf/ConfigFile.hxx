// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <filesystem>

namespace Gelf {

struct Config;

/**
 * Load the configuration file with the given path on top of the
 * given #Config instance.  The caller is responsible for calling
 * Config::Check() after applying other settings.
 *
 * Throws on error.
 */
void
LoadConfigFile(Config &config, const std::filesystem::path &path);

/**
 * Like LoadConfigFile(), but start with a default-constructed
 * #Config and check the result.
 */
Config
LoadConfigFile(const std::filesystem::path &path);

} // namespace Gelf

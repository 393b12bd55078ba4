// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "site/Registry.hxx"
#include "site/Policy.hxx"
#include "load/Throttle.hxx"
#include "dispatch/Config.hxx"
#include "spawn/Config.hxx"

#include <string>

struct Config {
	RegistryConfig registry;

	/**
	 * The account which must own the registry file (resolved to
	 * RegistryConfig::trusted_uid by Check()).
	 */
	std::string trusted_user = "root";

	PolicyConfig policy;

	ThrottleConfig throttle;

	DispatchConfig dispatch;

	std::string syslog_tag = "wp-cron";

	/**
	 * A local socket path or "host[:port]".
	 */
	std::string syslog_server = "/dev/log";

	SpawnConfig spawn;

	Config();

	void Check();
};

/**
 * Load and parse the specified configuration file.  A missing file
 * is not an error (the defaults apply).  Throws an exception on
 * error.
 */
void
LoadConfigFile(Config &config, const char *path);

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>

struct CommandLine {
	std::string config_path = "/etc/wp-cron-runner/runner.conf";
};

/** read configuration options from the command line */
CommandLine
ParseCommandLine(int argc, char **argv);

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <vector>

struct DispatchConfig;
struct AdmittedSite;

/**
 * Everything needed to spawn the task handler of one site, except
 * for the account.
 */
struct TaskCommand {
	std::vector<std::string> args;

	/**
	 * The working directory.
	 */
	std::string chdir;

	/**
	 * The value of $HOME.
	 */
	std::string home;
};

TaskCommand
MakeTaskCommand(const DispatchConfig &config, const AdmittedSite &site);

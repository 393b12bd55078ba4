// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Command.hxx"
#include "Config.hxx"
#include "site/Record.hxx"

TaskCommand
MakeTaskCommand(const DispatchConfig &config, const AdmittedSite &site)
{
	TaskCommand command{
		.chdir = site.real_path,
		.home = site.account.home,
	};

	command.args.push_back(config.php);

	switch (site.record.method) {
	case SiteMethod::WP_CLI:
		command.args.push_back(config.wp_cli);
		command.args.push_back("--path=" + site.real_path);
		command.args.insert(command.args.end(), {
				"cron", "event", "run", "--all",
				"--skip-plugins", "--skip-themes",
			});
		break;

	case SiteMethod::PHP_DIRECT:
		command.args.push_back(site.real_path + "/wp-cron.php");
		break;
	}

	return command;
}

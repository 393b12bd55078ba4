// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "debug.h"
#include "Instance.hxx"
#include "Hook.hxx"
#include "CommandLine.hxx"
#include "Config.hxx"
#include "site/Registry.hxx"
#include "site/Policy.hxx"
#include "report/Aggregator.hxx"
#include "report/RunLog.hxx"
#include "spawn/Launch.hxx"
#include "system/SetupProcess.hxx"
#include "net/UniqueSocketDescriptor.hxx"
#include "util/PrintException.hxx"
#include "config.h"

#ifdef HAVE_LIBCAP
#include "lib/cap/State.hxx"
#endif

#include <fmt/core.h>

#include <chrono>
#include <stdexcept>

#include <stdlib.h>
#include <unistd.h>

#ifndef NDEBUG
bool debug_mode = false;
#endif

/**
 * The exit status after the run was canceled by a signal.
 */
static constexpr int EXIT_INTERRUPTED = 130;

static void
DropInheritableCapabilities()
{
#ifdef HAVE_LIBCAP
	/* don't inherit any capabilities to spawned processes */
	auto state = CapabilityState::Current();
	state.ClearFlag(CAP_INHERITABLE);
	state.Install();
#endif
}

/**
 * Allow the spawner to switch to the accounts of all admitted
 * sites (and no others).
 */
static void
AllowAccounts(SpawnConfig &spawn, const std::vector<AdmittedSite> &sites)
{
	for (const auto &site : sites) {
		spawn.allowed_uids.insert(site.account.uid);
		spawn.allowed_gids.insert(site.account.gid);
		spawn.allowed_gids.insert(site.account.groups.begin(),
					  site.account.groups.end());
	}
}

static int
Dispatch(Config &config, std::vector<AdmittedSite> &&sites,
	 LogSink &log, OutcomeAggregator &aggregator)
{
	AllowAccounts(config.spawn, sites);

	RunnerSpawnHook hook{config.dispatch.php, debug_mode};

	auto spawner = LaunchSpawnServer(config.spawn, &hook);

	Instance instance{
		config,
		std::move(spawner.socket),
		spawner.cgroup.IsDefined(),
		log, aggregator,
	};

	spawner = {}; // close the pidfd

#ifdef HAVE_LIBCAP
	/* now that the spawner has been launched, drop all
	   capabilities, we don't need any */
	CapabilityState::Empty().Install();
#endif // HAVE_LIBCAP

	instance.Start(std::move(sites));

	/* main loop */

	instance.Run();

	return instance.WasInterrupted() ? EXIT_INTERRUPTED : EXIT_SUCCESS;
}

static int
Run(Config &config)
{
	SetupProcess();

	const auto start_time = std::chrono::steady_clock::now();

	auto log = RunLog::Open(config.syslog_server.c_str(),
				config.syslog_tag.c_str(), stdout);

	LoadedRegistry registry;

	try {
		registry = LoadRegistry(config.registry, *log);
	} catch (const ConfigError &e) {
		log->Log(LOG_ERR, fmt::format("ERROR: {}", e.what()));
		return EXIT_FAILURE;
	}

	if (registry.n_entries == 0) {
		log->Log(LOG_INFO, "INFO: No sites found in registry");
		return EXIT_SUCCESS;
	}

	log->Log(LOG_INFO,
		 fmt::format("INFO: Starting cron run for {} sites (max parallel: {}, CPU threshold: {}%)",
			     registry.n_entries, config.dispatch.concurrency,
			     config.throttle.cpu_threshold));

	OutcomeAggregator aggregator{*log};

	for (const auto &i : registry.invalid)
		aggregator.Add(i);

	auto validated = ValidateSites(config.policy,
				       std::move(registry.records), *log);

	for (const auto &i : validated.blocked)
		aggregator.Add(i);

	int status = EXIT_SUCCESS;
	if (!validated.admitted.empty())
		status = Dispatch(config, std::move(validated.admitted),
				  *log, aggregator);

	aggregator.Finish(std::chrono::steady_clock::now() - start_time);
	return status;
}

int
main(int argc, char **argv)
try {
#ifndef NDEBUG
	/* when started by an unprivileged user, trust that user and
	   run the task handlers without switching accounts */
	debug_mode = geteuid() != 0;
#endif

	const auto cmdline = ParseCommandLine(argc, argv);

	if (!debug_mode && geteuid() != 0)
		throw std::runtime_error{"This program must run as root"};

	Config config;

	/* configuration */

	LoadConfigFile(config, cmdline.config_path.c_str());

	DropInheritableCapabilities();

	config.Check();

	/* run */

	return Run(config);
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}

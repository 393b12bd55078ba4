// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Instance.hxx"
#include "Config.hxx"
#include "report/Aggregator.hxx"
#include "report/LogSink.hxx"
#include "report/Outcome.hxx"
#include "spawn/Client.hxx"
#include "net/UniqueSocketDescriptor.hxx"

Instance::Instance(const Config &config,
		   UniqueSocketDescriptor spawner_socket,
		   bool cgroups,
		   LogSink &_log, OutcomeAggregator &_aggregator)
	:shutdown_listener(event_loop, BIND_THIS_METHOD(OnExit)),
	 spawn_service(new SpawnServerClient(event_loop,
					     config.spawn,
					     std::move(spawner_socket),
					     cgroups,
					     /* disable "verify", we
						do it via SpawnHook */
					     false)),
	 monitor(config.throttle),
	 log(_log), aggregator(_aggregator),
	 dispatcher(event_loop, *spawn_service, config.dispatch,
		    monitor, _log, *this)
{
	shutdown_listener.Enable();
}

Instance::~Instance() noexcept = default;

void
Instance::OnExit() noexcept
{
	if (interrupted)
		return;

	interrupted = true;

	log.Log(LOG_INFO, "INFO: Received termination signal, cleaning up...");

	shutdown_listener.Disable();

	if (dispatcher.GetRunningCount() > 0)
		logger(2, "waiting for task handlers to exit");

	dispatcher.Cancel();
}

void
Instance::OnSiteOutcome(JobOutcome &&outcome) noexcept
{
	aggregator.Add(outcome);
}

void
Instance::OnDispatchFinished() noexcept
{
	shutdown_listener.Disable();
	spawn_service->Shutdown();
	event_loop.Break();
}

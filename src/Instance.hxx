// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "dispatch/Dispatcher.hxx"
#include "dispatch/Handler.hxx"
#include "load/ProcResourceMonitor.hxx"
#include "event/Loop.hxx"
#include "event/ShutdownListener.hxx"
#include "io/Logger.hxx"

#include <memory>
#include <vector>

struct Config;
struct AdmittedSite;
class UniqueSocketDescriptor;
class SpawnServerClient;
class LogSink;
class OutcomeAggregator;

class Instance final : DispatchHandler {
	const RootLogger logger;

	EventLoop event_loop;

	ShutdownListener shutdown_listener;

	std::unique_ptr<SpawnServerClient> spawn_service;

	ProcResourceMonitor monitor;

	LogSink &log;

	OutcomeAggregator &aggregator;

	SiteDispatcher dispatcher;

	/**
	 * Was the run canceled by a signal?
	 */
	bool interrupted = false;

public:
	Instance(const Config &config,
		 UniqueSocketDescriptor spawner_socket,
		 bool cgroups,
		 LogSink &_log, OutcomeAggregator &_aggregator);

	~Instance() noexcept;

	EventLoop &GetEventLoop() noexcept {
		return event_loop;
	}

	void Start(std::vector<AdmittedSite> &&sites) noexcept {
		dispatcher.Start(std::move(sites));
	}

	void Run() noexcept {
		event_loop.Run();
	}

	bool WasInterrupted() const noexcept {
		return interrupted;
	}

private:
	void OnExit() noexcept;

	/* virtual methods from DispatchHandler */
	void OnSiteOutcome(JobOutcome &&outcome) noexcept override;
	void OnDispatchFinished() noexcept override;
};

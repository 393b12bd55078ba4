// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Workplace.hxx"
#include "site/Record.hxx"
#include "spawn/ExitListener.hxx"
#include "event/FineTimerEvent.hxx"
#include "io/Logger.hxx"

#include <vector>

struct DispatchConfig;
class ResourceMonitor;
class LogSink;

/**
 * Starts the task handlers of all admitted sites, in registry order,
 * with a bounded number of them running at a time.  Before each
 * launch, it waits for the launch delay to expire and asks the
 * #ResourceMonitor whether the system is idle enough.
 */
class SiteDispatcher final : ExitListener {
	const Logger logger{"dispatch"};

	const DispatchConfig &config;

	ResourceMonitor &monitor;

	/**
	 * Throttle events are written to the run log.
	 */
	LogSink &log;

	DispatchHandler &handler;

	SiteWorkplace workplace;

	/**
	 * Runs the admission check (launch delay, throttle backoff
	 * or after a slot was released).
	 */
	FineTimerEvent admit_timer;

	std::vector<AdmittedSite> sites;

	/**
	 * Index of the next site in #sites to be launched.
	 */
	std::size_t next = 0;

	Event::TimePoint last_launch;

	bool launched_any = false, canceled = false, finished = false;

public:
	SiteDispatcher(EventLoop &event_loop, SpawnService &spawn_service,
		       const DispatchConfig &_config,
		       ResourceMonitor &_monitor, LogSink &_log,
		       DispatchHandler &_handler) noexcept;

	~SiteDispatcher() noexcept;

	SiteDispatcher(const SiteDispatcher &) = delete;
	SiteDispatcher &operator=(const SiteDispatcher &) = delete;

	auto &GetEventLoop() const noexcept {
		return admit_timer.GetEventLoop();
	}

	std::size_t GetRunningCount() const noexcept {
		return workplace.GetCount();
	}

	bool IsFinished() const noexcept {
		return finished;
	}

	/**
	 * Begin dispatching.  DispatchHandler::OnDispatchFinished()
	 * is invoked when all sites have produced an outcome (maybe
	 * right away if the list is empty).
	 */
	void Start(std::vector<AdmittedSite> &&_sites) noexcept;

	/**
	 * Stop launching new task handlers and terminate the running
	 * ones.  DispatchHandler::OnDispatchFinished() is invoked
	 * after all of them have exited.  Sites which have not been
	 * launched yet do not produce an outcome.
	 */
	void Cancel() noexcept;

private:
	bool HasPending() const noexcept {
		return !canceled && next < sites.size();
	}

	void ScheduleAdmit(Event::Duration delay) noexcept {
		admit_timer.Schedule(delay);
	}

	void OnAdmitTimer() noexcept;

	void Launch(const AdmittedSite &site) noexcept;

	void CheckFinished() noexcept;

	/* virtual methods from ExitListener */
	void OnChildProcessExit(int status) noexcept override;
};

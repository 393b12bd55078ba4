// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Dispatcher.hxx"
#include "Config.hxx"
#include "Handler.hxx"
#include "load/ResourceMonitor.hxx"
#include "report/LogSink.hxx"
#include "report/Outcome.hxx"
#include "event/Loop.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"

#include <fmt/core.h>

using std::string_view_literals::operator""sv;

SiteDispatcher::SiteDispatcher(EventLoop &event_loop,
			       SpawnService &spawn_service,
			       const DispatchConfig &_config,
			       ResourceMonitor &_monitor, LogSink &_log,
			       DispatchHandler &_handler) noexcept
	:config(_config), monitor(_monitor), log(_log), handler(_handler),
	 workplace(event_loop, spawn_service, _config, _handler, *this),
	 admit_timer(event_loop, BIND_THIS_METHOD(OnAdmitTimer))
{
}

SiteDispatcher::~SiteDispatcher() noexcept = default;

void
SiteDispatcher::Start(std::vector<AdmittedSite> &&_sites) noexcept
{
	sites = std::move(_sites);
	next = 0;

	logger.Fmt(4, "dispatching {} sites"sv, sites.size());

	ScheduleAdmit(Event::Duration::zero());
}

void
SiteDispatcher::Cancel() noexcept
{
	if (canceled || finished)
		return;

	canceled = true;
	admit_timer.Cancel();

	if (next < sites.size())
		logger.Fmt(2, "canceled, {} sites were not started"sv,
			   sites.size() - next);

	workplace.CancelAll();
	CheckFinished();
}

void
SiteDispatcher::OnAdmitTimer() noexcept
{
	if (!HasPending()) {
		CheckFinished();
		return;
	}

	if (workplace.IsFull())
		/* wait for OnChildProcessExit() */
		return;

	const auto now = GetEventLoop().SteadyNow();
	if (launched_any && now < last_launch + config.launch_delay) {
		ScheduleAdmit(last_launch + config.launch_delay - now);
		return;
	}

	if (const auto signal = monitor.ShouldThrottle(); signal.throttle) {
		const auto backoff = std::chrono::duration_cast<std::chrono::duration<double>>(config.throttle_backoff);
		log.Log(LOG_WARNING,
			fmt::format("THROTTLE: {}, pausing {}s before starting {}",
				    signal.reason, backoff.count(),
				    sites[next].real_path));
		ScheduleAdmit(config.throttle_backoff);
		return;
	}

	const auto &site = sites[next++];
	last_launch = now;
	launched_any = true;

	Launch(site);

	if (HasPending() && !workplace.IsFull())
		ScheduleAdmit(config.launch_delay);
	else if (!HasPending())
		CheckFinished();
}

void
SiteDispatcher::Launch(const AdmittedSite &site) noexcept
{
	try {
		workplace.Start(site);
	} catch (...) {
		logger.Fmt(1, "failed to start {:?}: {}"sv,
			   site.real_path, std::current_exception());
		handler.OnSiteOutcome(JobOutcome::Failure(site.record, {},
							  fmt::format("spawn failed: {}",
								      std::current_exception())));
	}
}

void
SiteDispatcher::CheckFinished() noexcept
{
	if (finished || HasPending() || !workplace.IsEmpty())
		return;

	finished = true;
	admit_timer.Cancel();
	handler.OnDispatchFinished();
}

void
SiteDispatcher::OnChildProcessExit(int) noexcept
{
	if (HasPending()) {
		if (!admit_timer.IsPending())
			ScheduleAdmit(Event::Duration::zero());
	} else
		CheckFinished();
}

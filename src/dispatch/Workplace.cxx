// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Workplace.hxx"
#include "Config.hxx"
#include "Command.hxx"
#include "Handler.hxx"
#include "site/Record.hxx"
#include "report/Outcome.hxx"
#include "spawn/Interface.hxx"
#include "spawn/Prepared.hxx"
#include "spawn/ProcessHandle.hxx"
#include "spawn/ExitListener.hxx"
#include "event/FarTimerEvent.hxx"
#include "event/FineTimerEvent.hxx"
#include "event/Loop.hxx"
#include "io/Logger.hxx"
#include "io/Open.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "util/DeleteDisposer.hxx"
#include "debug.h"

#include <fmt/core.h>

#include <algorithm>
#include <cassert>
#include <memory>
#include <stdexcept>

#include <signal.h>
#include <stdlib.h>
#include <sys/wait.h>

using std::string_view_literals::operator""sv;

static constexpr const char *DEFAULT_PATH = "/usr/local/bin:/usr/bin:/bin";

class SiteWorkplace::Running final
	: public IntrusiveListHook<>, ExitListener, LoggerDomainFactory
{
	SiteWorkplace &workplace;
	const AdmittedSite site;

	const Event::TimePoint start_time;

	FarTimerEvent timeout_event;

	/**
	 * Sends SIGKILL if the process is still alive this long
	 * after Cancel().
	 */
	FineTimerEvent kill_event;

	std::unique_ptr<ChildProcessHandle> pid;

	LazyDomainLogger logger{*this};

	bool canceled = false;

public:
	Running(SiteWorkplace &_workplace, const AdmittedSite &_site) noexcept
		:workplace(_workplace), site(_site),
		 start_time(workplace.event_loop.SteadyNow()),
		 timeout_event(workplace.event_loop,
			       BIND_THIS_METHOD(OnTimeout)),
		 kill_event(workplace.event_loop,
			    BIND_THIS_METHOD(OnKillGrace)) {}

	/**
	 * Throws on error.
	 */
	void Start();

	void Cancel() noexcept {
		if (canceled)
			return;

		canceled = true;
		timeout_event.Cancel();

		logger(3, "sending SIGTERM");
		pid->Kill(SIGTERM);
		kill_event.Schedule(workplace.config.kill_grace);
	}

private:
	std::chrono::duration<double> GetDuration() const noexcept {
		return workplace.event_loop.SteadyNow() - start_time;
	}

	void OnTimeout() noexcept {
		logger(2, "timeout, sending SIGKILL");
		pid->Kill(SIGKILL);

		const auto timeout = std::chrono::duration_cast<std::chrono::seconds>(workplace.config.timeout);
		workplace.OnCompletion(*this,
				       JobOutcome::Failure(site.record,
							   GetDuration(),
							   fmt::format("timeout after {}s",
								       timeout.count())));
	}

	void OnKillGrace() noexcept {
		logger(2, "still running after SIGTERM, sending SIGKILL");
		pid->Kill(SIGKILL);
	}

	/* virtual methods from ExitListener */
	void OnChildProcessExit(int status) noexcept override;

	/* virtual methods from LoggerDomainFactory */
	std::string MakeLoggerDomain() const noexcept override {
		return fmt::format("site path={} user={}",
				   site.real_path, site.record.owner);
	}
};

static void
SetAccount(UidGid &uid_gid, const SiteAccount &account)
{
	if (account.groups.size() > uid_gid.supplementary_groups.size())
		throw std::runtime_error{"Too many supplementary groups"};

	uid_gid.effective_uid = account.uid;
	uid_gid.effective_gid = account.gid;
	const auto end = std::copy(account.groups.begin(), account.groups.end(),
				   uid_gid.supplementary_groups.begin());
	if (end != uid_gid.supplementary_groups.end())
		*end = UidGid::UNSET_GID;
}

inline void
SiteWorkplace::Running::Start()
{
	const auto command = MakeTaskCommand(workplace.config, site);

	PreparedChildProcess p;
	for (const auto &i : command.args)
		p.args.push_back(i.c_str());

	if (!debug_mode)
		SetAccount(p.uid_gid, site.account);

	p.chdir = command.chdir.c_str();
	p.SetEnv("HOME", command.home);

	const char *path = getenv("PATH");
	p.SetEnv("PATH", path != nullptr ? path : DEFAULT_PATH);

	/* the task handler's output is not used */
	auto null_fd = OpenWriteOnly("/dev/null");
	p.stdout_fd = p.stderr_fd = null_fd;

	p.no_new_privs = true;

	pid = workplace.spawn_service.SpawnChildProcess(site.real_path.c_str(),
							std::move(p));
	pid->SetExitListener(*this);

	timeout_event.Schedule(workplace.config.timeout);

	logger(4, "running");
}

void
SiteWorkplace::Running::OnChildProcessExit(int status) noexcept
{
	const auto duration = GetDuration();

	if (canceled) {
		logger(3, "canceled");
		workplace.OnCompletion(*this,
				       JobOutcome::Failure(site.record, duration,
							   "canceled"));
		return;
	}

	if (WIFSIGNALED(status)) {
		logger(1, "died from signal ",
		       WTERMSIG(status),
		       WCOREDUMP(status) ? " (core dumped)" : "");
		workplace.OnCompletion(*this,
				       JobOutcome::Failure(site.record, duration,
							   fmt::format("died from signal {}",
								       WTERMSIG(status))));
		return;
	}

	const int exit_status = WEXITSTATUS(status);
	if (exit_status == 0) {
		logger(4, "exited with success");
		workplace.OnCompletion(*this,
				       JobOutcome::Success(site.record, duration));
	} else {
		logger(2, "exited with status ", exit_status);
		workplace.OnCompletion(*this,
				       JobOutcome::Failure(site.record, duration,
							   fmt::format("exit status {}",
								       exit_status)));
	}
}

SiteWorkplace::SiteWorkplace(EventLoop &_event_loop,
			     SpawnService &_spawn_service,
			     const DispatchConfig &_config,
			     DispatchHandler &_handler,
			     ExitListener &_exit_listener)
	:event_loop(_event_loop),
	 spawn_service(_spawn_service),
	 config(_config),
	 handler(_handler),
	 exit_listener(_exit_listener),
	 max_operators(_config.concurrency)
{
	assert(max_operators > 0);
}

SiteWorkplace::~SiteWorkplace() noexcept
{
	running.clear_and_dispose(DeleteDisposer{});
}

void
SiteWorkplace::Start(const AdmittedSite &site)
{
	assert(!IsFull());

	auto r = std::make_unique<Running>(*this, site);
	r->Start();

	running.push_back(*r.release());
}

inline void
SiteWorkplace::OnCompletion(Running &r, JobOutcome &&outcome) noexcept
{
	running.erase_and_dispose(running.iterator_to(r),
				  DeleteDisposer{});

	handler.OnSiteOutcome(std::move(outcome));
	exit_listener.OnChildProcessExit(-1);
}

void
SiteWorkplace::CancelAll() noexcept
{
	for (auto &r : running)
		r.Cancel();
}

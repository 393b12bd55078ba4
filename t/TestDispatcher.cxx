#include "dispatch/Dispatcher.hxx"
#include "dispatch/Config.hxx"
#include "dispatch/Handler.hxx"
#include "load/ResourceMonitor.hxx"
#include "report/Outcome.hxx"
#include "event/Loop.hxx"
#include "event/FineTimerEvent.hxx"
#include "CaptureLog.hxx"
#include "FakeSpawn.hxx"

#include <gtest/gtest.h>

#include <signal.h>
#include <unistd.h>

using std::string_view_literals::operator""sv;

class FakeResourceMonitor final : public ResourceMonitor {
	const FakeSpawnService &spawn;

public:
	/**
	 * Report "throttle" for this many polls.
	 */
	unsigned throttle_polls = 0;

	unsigned n_polls = 0;

	/**
	 * The number of spawned processes at each poll.
	 */
	std::vector<std::size_t> spawned_at_poll;

	explicit FakeResourceMonitor(const FakeSpawnService &_spawn) noexcept
		:spawn(_spawn) {}

	ThrottleSignal ShouldThrottle() noexcept override {
		++n_polls;
		spawned_at_poll.push_back(spawn.processes.size());

		if (throttle_polls > 0) {
			--throttle_polls;
			return {true, "CPU usage 99% exceeds threshold 80%"};
		}

		return {};
	}
};

/**
 * Runs a #SiteDispatcher on a real #EventLoop with a
 * #FakeSpawnService.
 */
class DispatcherTest : public ::testing::Test, public DispatchHandler {
protected:
	EventLoop event_loop;
	FakeSpawnService spawn{event_loop};
	FakeResourceMonitor monitor{spawn};
	CaptureLog log;

	DispatchConfig config;

	std::vector<JobOutcome> outcomes;
	bool finished = false;

	/**
	 * Aborts the test if the dispatcher hangs.
	 */
	FineTimerEvent watchdog{event_loop, BIND_THIS_METHOD(OnWatchdog)};
	bool watchdog_fired = false;

	FineTimerEvent cancel_timer{event_loop, BIND_THIS_METHOD(OnCancelTimer)};
	SiteDispatcher *cancel_dispatcher = nullptr;

	DispatcherTest() {
		config.concurrency = 2;
		config.launch_delay = Event::Duration::zero();
		config.throttle_backoff = std::chrono::milliseconds(10);
		config.timeout = std::chrono::seconds(10);
		config.kill_grace = std::chrono::milliseconds(20);
	}

	static AdmittedSite MakeSite(unsigned i) {
		const auto path = "/var/www/site" + std::to_string(i);
		return {
			.record = {
				.path = path,
				.owner = "alice",
				.method = SiteMethod::WP_CLI,
				.line = i,
			},
			.real_path = path,
			.account = {
				.uid = geteuid(),
				.gid = getegid(),
				.home = "/tmp",
			},
		};
	}

	static std::vector<AdmittedSite> MakeSites(unsigned n) {
		std::vector<AdmittedSite> sites;
		for (unsigned i = 1; i <= n; ++i)
			sites.push_back(MakeSite(i));
		return sites;
	}

	void Run(SiteDispatcher &dispatcher, std::vector<AdmittedSite> &&sites) {
		watchdog.Schedule(std::chrono::seconds(20));
		dispatcher.Start(std::move(sites));
		if (!finished)
			event_loop.Run();
		watchdog.Cancel();

		ASSERT_FALSE(watchdog_fired);
		ASSERT_TRUE(finished);
		EXPECT_TRUE(dispatcher.IsFinished());
		EXPECT_EQ(spawn.n_alive, 0u);
	}

	void Run(std::vector<AdmittedSite> &&sites) {
		SiteDispatcher dispatcher(event_loop, spawn, config,
					  monitor, log, *this);
		Run(dispatcher, std::move(sites));
	}

	void CancelAfter(SiteDispatcher &dispatcher, Event::Duration delay) noexcept {
		cancel_dispatcher = &dispatcher;
		cancel_timer.Schedule(delay);
	}

	std::size_t Count(JobStatus status) const noexcept {
		return std::count_if(outcomes.begin(), outcomes.end(),
				     [status](const auto &i){
					     return i.status == status;
				     });
	}

	const JobOutcome *Find(std::string_view path) const noexcept {
		for (const auto &i : outcomes)
			if (i.path == path)
				return &i;
		return nullptr;
	}

private:
	void OnCancelTimer() noexcept {
		cancel_dispatcher->Cancel();
	}

	void OnWatchdog() noexcept {
		watchdog_fired = true;
		event_loop.Break();
	}

	/* virtual methods from DispatchHandler */
	void OnSiteOutcome(JobOutcome &&outcome) noexcept override {
		outcomes.push_back(std::move(outcome));
	}

	void OnDispatchFinished() noexcept override {
		finished = true;
		event_loop.Break();
	}
};

TEST_F(DispatcherTest, Empty)
{
	Run({});
	EXPECT_TRUE(outcomes.empty());
	EXPECT_TRUE(spawn.processes.empty());
}

TEST_F(DispatcherTest, AllSucceed)
{
	Run(MakeSites(7));

	ASSERT_EQ(outcomes.size(), 7u);
	EXPECT_EQ(Count(JobStatus::SUCCESS), 7u);
	EXPECT_EQ(spawn.max_alive, 2u);

	/* launched in registry order */
	ASSERT_EQ(spawn.processes.size(), 7u);
	for (unsigned i = 0; i < 7; ++i)
		EXPECT_EQ(spawn.processes[i].name,
			  "/var/www/site" + std::to_string(i + 1));

	const auto &args = spawn.processes.front().args;
	ASSERT_FALSE(args.empty());
	EXPECT_EQ(args.front(), config.php);
	EXPECT_EQ(args[2], "--path=/var/www/site1");
}

TEST_F(DispatcherTest, ConcurrencyOne)
{
	config.concurrency = 1;
	Run(MakeSites(3));

	EXPECT_EQ(Count(JobStatus::SUCCESS), 3u);
	EXPECT_EQ(spawn.max_alive, 1u);
}

TEST_F(DispatcherTest, Failure)
{
	spawn.behaviors["/var/www/site2"].status = 3 << 8;
	spawn.behaviors["/var/www/site3"].status = SIGSEGV;

	Run(MakeSites(3));

	ASSERT_EQ(outcomes.size(), 3u);
	EXPECT_EQ(Find("/var/www/site1")->status, JobStatus::SUCCESS);

	const auto *o = Find("/var/www/site2");
	EXPECT_EQ(o->status, JobStatus::FAILURE);
	EXPECT_EQ(o->detail, "exit status 3");

	o = Find("/var/www/site3");
	EXPECT_EQ(o->status, JobStatus::FAILURE);
	EXPECT_NE(o->detail.find("signal"), o->detail.npos);
}

TEST_F(DispatcherTest, SpawnError)
{
	spawn.behaviors["/var/www/site1"].fail_spawn = true;

	Run(MakeSites(2));

	ASSERT_EQ(outcomes.size(), 2u);
	const auto *o = Find("/var/www/site1");
	EXPECT_EQ(o->status, JobStatus::FAILURE);
	EXPECT_NE(o->detail.find("spawn failed"), o->detail.npos);
	EXPECT_EQ(Find("/var/www/site2")->status, JobStatus::SUCCESS);
}

TEST_F(DispatcherTest, Timeout)
{
	config.timeout = std::chrono::milliseconds(30);
	spawn.behaviors["/var/www/site1"].runtime = std::chrono::hours(1);

	Run(MakeSites(2));

	ASSERT_EQ(outcomes.size(), 2u);
	const auto *o = Find("/var/www/site1");
	EXPECT_EQ(o->status, JobStatus::FAILURE);
	EXPECT_NE(o->detail.find("timeout"), o->detail.npos);
	EXPECT_TRUE(spawn.processes.front().HasSignal(SIGKILL));

	EXPECT_EQ(Find("/var/www/site2")->status, JobStatus::SUCCESS);
}

TEST_F(DispatcherTest, Throttle)
{
	monitor.throttle_polls = 3;

	Run(MakeSites(2));

	EXPECT_EQ(Count(JobStatus::SUCCESS), 2u);

	/* nothing was launched while the monitor said "throttle" */
	ASSERT_GE(monitor.spawned_at_poll.size(), 4u);
	for (unsigned i = 0; i < 4; ++i)
		EXPECT_EQ(monitor.spawned_at_poll[i], 0u);

	EXPECT_EQ(log.Count("THROTTLE"sv), 3u);
}

TEST_F(DispatcherTest, LaunchDelay)
{
	config.launch_delay = std::chrono::milliseconds(20);

	const auto start = std::chrono::steady_clock::now();
	Run(MakeSites(3));
	const auto duration = std::chrono::steady_clock::now() - start;

	EXPECT_EQ(Count(JobStatus::SUCCESS), 3u);
	EXPECT_GE(duration, std::chrono::milliseconds(40));
}

TEST_F(DispatcherTest, Cancel)
{
	spawn.default_behavior.runtime = std::chrono::hours(1);

	SiteDispatcher dispatcher(event_loop, spawn, config,
				  monitor, log, *this);

	CancelAfter(dispatcher, std::chrono::milliseconds(20));

	Run(dispatcher, MakeSites(5));

	/* only the running sites produce an outcome */
	ASSERT_EQ(spawn.processes.size(), 2u);
	ASSERT_EQ(outcomes.size(), 2u);
	for (const auto &i : outcomes) {
		EXPECT_EQ(i.status, JobStatus::FAILURE);
		EXPECT_EQ(i.detail, "canceled");
	}

	for (const auto &i : spawn.processes) {
		EXPECT_TRUE(i.HasSignal(SIGTERM));
		EXPECT_FALSE(i.HasSignal(SIGKILL));
	}
}

TEST_F(DispatcherTest, CancelKillGrace)
{
	spawn.default_behavior.runtime = std::chrono::hours(1);
	spawn.default_behavior.ignore_sigterm = true;

	SiteDispatcher dispatcher(event_loop, spawn, config,
				  monitor, log, *this);

	CancelAfter(dispatcher, std::chrono::milliseconds(20));

	Run(dispatcher, MakeSites(1));

	ASSERT_EQ(outcomes.size(), 1u);
	EXPECT_EQ(outcomes.front().detail, "canceled");

	const auto &p = spawn.processes.front();
	EXPECT_TRUE(p.HasSignal(SIGTERM));
	EXPECT_TRUE(p.HasSignal(SIGKILL));
}

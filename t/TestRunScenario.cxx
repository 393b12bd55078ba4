#include "site/Registry.hxx"
#include "site/Policy.hxx"
#include "dispatch/Dispatcher.hxx"
#include "dispatch/Config.hxx"
#include "dispatch/Handler.hxx"
#include "load/ResourceMonitor.hxx"
#include "report/Aggregator.hxx"
#include "report/Outcome.hxx"
#include "event/Loop.hxx"
#include "CaptureLog.hxx"
#include "FakeSpawn.hxx"
#include "TempDir.hxx"
#include "TestAccount.hxx"

#include <gtest/gtest.h>

#include <sys/stat.h>
#include <unistd.h>

class IdleResourceMonitor final : public ResourceMonitor {
public:
	ThrottleSignal ShouldThrottle() noexcept override {
		return {};
	}
};

/**
 * A complete run: registry file, policy checks, dispatch (with a
 * fake spawner) and the summary.
 */
class RunScenario : public ::testing::Test, DispatchHandler {
protected:
	TempDir root;
	TestAccount account;

	RegistryConfig registry_config;
	PolicyConfig policy;
	DispatchConfig dispatch_config;

	EventLoop event_loop;
	FakeSpawnService spawn{event_loop};
	IdleResourceMonitor monitor;

	CaptureLog log;
	OutcomeAggregator aggregator{log};

	void SetUp() override {
		const auto a = FindTestAccount();
		if (!a)
			GTEST_SKIP() << "No test account";

		account = *a;

		registry_config.trusted_uid = geteuid();
		registry_config.path = root.Child("wordpress-sites.conf");

		policy.allowed_roots = {root.GetPath()};
		policy.denied_users.clear();
		policy.disabled_shells.clear();

		dispatch_config.launch_delay = Event::Duration::zero();
	}

	std::string MakeSite(std::string_view name) {
		auto path = root.MakeDirectory(name);
		ChownToTestAccount(path, account);

		root.WriteFile(std::string{name} + "/wp-config.php", "<?php\n", 0644);
		return path;
	}

	void WriteRegistry(std::string_view contents, mode_t mode=0600) {
		root.WriteFile("wordpress-sites.conf", contents, mode);
	}

	RunSummary Run() {
		auto registry = LoadRegistry(registry_config, log);
		for (const auto &i : registry.invalid)
			aggregator.Add(i);

		auto validated = ValidateSites(policy, std::move(registry.records),
					       log);
		for (const auto &i : validated.blocked)
			aggregator.Add(i);

		SiteDispatcher dispatcher(event_loop, spawn, dispatch_config,
					  monitor, log, *this);
		dispatcher.Start(std::move(validated.admitted));
		if (!dispatcher.IsFinished())
			event_loop.Run();

		EXPECT_TRUE(dispatcher.IsFinished());
		return aggregator.Finish({});
	}

private:
	/* virtual methods from DispatchHandler */
	void OnSiteOutcome(JobOutcome &&outcome) noexcept override {
		aggregator.Add(outcome);
	}

	void OnDispatchFinished() noexcept override {
		event_loop.Break();
	}
};

TEST_F(RunScenario, ThreeValid)
{
	std::string registry;
	for (const char *name : {"a", "b", "c"})
		registry += MakeSite(name) + "|" + account.name + "|wp-cli\n";
	WriteRegistry(registry);

	const auto s = Run();
	EXPECT_EQ(s.total, 3u);
	EXPECT_EQ(s.success, 3u);
	EXPECT_EQ(s.failure, 0u);
	EXPECT_EQ(s.blocked, 0u);
	EXPECT_EQ(s.invalid, 0u);
	EXPECT_FALSE(s.alert);
	EXPECT_EQ(spawn.processes.size(), 3u);
}

TEST_F(RunScenario, OwnerMismatch)
{
	const auto other = FindOtherAccount(account.uid);
	if (!other)
		GTEST_SKIP() << "No other account";

	const auto a = MakeSite("a"), b = MakeSite("b"), c = MakeSite("c");
	WriteRegistry(a + "|" + account.name + "|wp-cli\n" +
		      b + "|" + other->name + "|wp-cli\n" +
		      c + "|" + account.name + "|wp-cli\n");

	const auto s = Run();
	EXPECT_EQ(s.total, 3u);
	EXPECT_EQ(s.success, 2u);
	EXPECT_EQ(s.blocked, 1u);
	EXPECT_TRUE(s.alert);

	/* the blocked site was never spawned */
	ASSERT_EQ(spawn.processes.size(), 2u);
	for (const auto &i : spawn.processes)
		EXPECT_NE(i.name, b);

	EXPECT_TRUE(log.Contains("owner mismatch"));
}

TEST_F(RunScenario, TooManyEntries)
{
	std::string registry;
	for (unsigned i = 0; i < 1500; ++i)
		registry += root.Child("site" + std::to_string(i)) + "|" + account.name + "|wp-cli\n";
	WriteRegistry(registry);

	try {
		Run();
		FAIL() << "No exception thrown";
	} catch (const ConfigError &e) {
		EXPECT_EQ(e.GetCode(), ConfigError::Code::TOO_MANY_ENTRIES);
	}

	EXPECT_TRUE(spawn.processes.empty());
}

TEST_F(RunScenario, WorldReadableRegistry)
{
	WriteRegistry(MakeSite("a") + "|" + account.name + "|wp-cli\n", 0644);

	const auto s = Run();
	EXPECT_EQ(s.success, 1u);

	struct stat st;
	ASSERT_EQ(stat(registry_config.path.c_str(), &st), 0);
	EXPECT_EQ(st.st_mode & 07777, 0600u);
	EXPECT_TRUE(log.Contains("permissions should be 600"));
}

TEST_F(RunScenario, Totals)
{
	const auto a = MakeSite("a"), b = MakeSite("b");
	spawn.behaviors[b].status = 1 << 8;

	WriteRegistry("# managed sites\n" +
		      a + "|" + account.name + "|wp-cli\n" +
		      b + "|" + account.name + "|wp-cli\n" +
		      "/etc|" + account.name + "|wp-cli\n" +
		      a + "|" + account.name + "|wp-cli\n" +
		      "garbage\n" +
		      "\n");

	const auto s = Run();
	EXPECT_EQ(s.success, 1u);
	EXPECT_EQ(s.failure, 1u);
	EXPECT_EQ(s.blocked, 1u);
	EXPECT_EQ(s.invalid, 2u);
	EXPECT_EQ(s.total, 5u);
	EXPECT_EQ(s.success + s.failure + s.blocked + s.invalid, s.total);
}

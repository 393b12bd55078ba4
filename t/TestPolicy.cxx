#include "site/Policy.hxx"
#include "CaptureLog.hxx"
#include "TempDir.hxx"
#include "TestAccount.hxx"

#include <gtest/gtest.h>

#include <sys/stat.h>
#include <unistd.h>

TEST(Policy, IsBelowRoot)
{
	EXPECT_TRUE(IsBelowRoot("/var/www", "/var/www"));
	EXPECT_TRUE(IsBelowRoot("/var/www/site", "/var/www"));
	EXPECT_TRUE(IsBelowRoot("/var/www/site", "/var/www/"));
	EXPECT_TRUE(IsBelowRoot("/var/www/a/b/c", "/var/www"));
	EXPECT_FALSE(IsBelowRoot("/var/wwwevil", "/var/www"));
	EXPECT_FALSE(IsBelowRoot("/var/ww", "/var/www"));
	EXPECT_FALSE(IsBelowRoot("/etc/passwd", "/var/www"));
	EXPECT_FALSE(IsBelowRoot("var/www/site", "/var/www"));
	EXPECT_TRUE(IsBelowRoot("/anything", "/"));
}

TEST(Policy, IsBelowAllowedRoot)
{
	const PolicyConfig policy;
	EXPECT_TRUE(IsBelowAllowedRoot(policy, "/var/www/example"));
	EXPECT_TRUE(IsBelowAllowedRoot(policy, "/home/alice/public_html"));
	EXPECT_FALSE(IsBelowAllowedRoot(policy, "/homework/site"));
	EXPECT_FALSE(IsBelowAllowedRoot(policy, "/srv/www/site"));
	EXPECT_FALSE(IsBelowAllowedRoot(policy, "/"));
}

TEST(Policy, IsDeniedUser)
{
	const PolicyConfig policy;
	EXPECT_TRUE(IsDeniedUser(policy, "root"));
	EXPECT_TRUE(IsDeniedUser(policy, "nobody"));
	EXPECT_FALSE(IsDeniedUser(policy, "www-data"));
	EXPECT_TRUE(IsDeniedUser(policy, "_apt"));
	EXPECT_TRUE(IsDeniedUser(policy, "systemd-network"));
	EXPECT_FALSE(IsDeniedUser(policy, "systemd"));
	EXPECT_FALSE(IsDeniedUser(policy, "rooter"));
	EXPECT_FALSE(IsDeniedUser(policy, "alice"));
}

/**
 * Fixture: a temporary allowed root containing one WordPress site
 * owned by the test account.
 */
class PolicyTest : public ::testing::Test {
protected:
	TempDir root;
	PolicyConfig policy;
	TestAccount account;
	std::string site;

	void SetUp() override {
		const auto a = FindTestAccount();
		if (!a)
			GTEST_SKIP() << "No test account";

		account = *a;

		policy.allowed_roots = {root.GetPath()};
		policy.denied_users.clear();
		policy.disabled_shells.clear();

		site = MakeSite("site");
	}

	std::string MakeSite(std::string_view name) {
		auto path = root.MakeDirectory(name);
		ChownToTestAccount(path, account);

		const auto config = std::string{name} + "/wp-config.php";
		root.WriteFile(config, "<?php\n", 0644);
		ChownToTestAccount(root.Child(config), account);
		return path;
	}

	SiteRecord MakeRecord(std::string_view path,
			      SiteMethod method=SiteMethod::WP_CLI) const {
		return {
			.path = std::string{path},
			.owner = account.name,
			.method = method,
			.line = 1,
		};
	}

	std::string Violation(const SiteRecord &record) {
		CaptureLog log;
		try {
			ValidateSite(policy, record, log);
		} catch (const SecurityViolation &e) {
			return e.what();
		}

		return {};
	}
};

TEST_F(PolicyTest, Admitted)
{
	CaptureLog log;
	const auto admitted = ValidateSite(policy, MakeRecord(site), log);
	EXPECT_EQ(admitted.real_path, site);
	EXPECT_EQ(admitted.account.uid, account.uid);
	EXPECT_EQ(admitted.account.gid, account.gid);
	EXPECT_EQ(admitted.record.owner, account.name);
}

TEST_F(PolicyTest, Traversal)
{
	const auto v = Violation(MakeRecord(site + "/../site"));
	EXPECT_NE(v.find("traversal"), v.npos) << v;
}

TEST_F(PolicyTest, OutsideRoot)
{
	const auto v = Violation(MakeRecord("/etc"));
	EXPECT_NE(v.find("outside allowed"), v.npos) << v;
}

TEST_F(PolicyTest, SymlinkEscape)
{
	const auto link = root.Child("escape");
	ASSERT_EQ(symlink("/etc", link.c_str()), 0);

	const auto v = Violation(MakeRecord(link));
	EXPECT_NE(v.find("Resolved path outside"), v.npos) << v;
}

TEST_F(PolicyTest, SymlinkInside)
{
	const auto link = root.Child("alias");
	ASSERT_EQ(symlink(site.c_str(), link.c_str()), 0);

	CaptureLog log;
	const auto admitted = ValidateSite(policy, MakeRecord(link), log);
	EXPECT_EQ(admitted.real_path, site);
}

TEST_F(PolicyTest, Missing)
{
	const auto v = Violation(MakeRecord(root.Child("missing")));
	EXPECT_FALSE(v.empty());
}

TEST_F(PolicyTest, DeniedUser)
{
	policy.denied_users = {account.name};

	const auto v = Violation(MakeRecord(site));
	EXPECT_NE(v.find("system user"), v.npos) << v;
}

TEST_F(PolicyTest, UnknownUser)
{
	auto record = MakeRecord(site);
	record.owner = "no-such-user-wp-cron-test";

	const auto v = Violation(record);
	EXPECT_NE(v.find("User not found"), v.npos) << v;
}

TEST_F(PolicyTest, DisabledShell)
{
	policy.disabled_shells = {account.shell};

	const auto v = Violation(MakeRecord(site));
	EXPECT_NE(v.find("disabled shell"), v.npos) << v;
}

TEST_F(PolicyTest, UnusualShell)
{
	policy.known_shells.clear();

	CaptureLog log;
	ValidateSite(policy, MakeRecord(site), log);
	ASSERT_EQ(log.lines.size(), 1u);
	EXPECT_EQ(log.lines.front().priority, LOG_WARNING);
	EXPECT_TRUE(log.Contains("unusual shell"));
}

TEST_F(PolicyTest, NoWpConfig)
{
	const auto path = root.MakeDirectory("empty");
	ChownToTestAccount(path, account);

	const auto v = Violation(MakeRecord(path));
	EXPECT_NE(v.find("wp-config.php"), v.npos) << v;
}

TEST_F(PolicyTest, OwnerMismatch)
{
	const auto other = FindOtherAccount(account.uid);
	if (!other)
		GTEST_SKIP() << "No other account";

	auto record = MakeRecord(site);
	record.owner = other->name;

	const auto v = Violation(record);
	EXPECT_NE(v.find("owner mismatch"), v.npos) << v;
}

TEST_F(PolicyTest, PhpDirect)
{
	const auto v = Violation(MakeRecord(site, SiteMethod::PHP_DIRECT));
	EXPECT_NE(v.find("wp-cron.php"), v.npos) << v;

	root.WriteFile("site/wp-cron.php", "<?php\n", 0644);

	CaptureLog log;
	EXPECT_NO_THROW(ValidateSite(policy,
				     MakeRecord(site, SiteMethod::PHP_DIRECT),
				     log));
}

TEST_F(PolicyTest, ConfigFileChanges)
{
	/* each check looks at the current filesystem state */
	const auto config = root.Child("site/wp-config.php");
	ASSERT_EQ(unlink(config.c_str()), 0);

	const auto v = Violation(MakeRecord(site));
	EXPECT_NE(v.find("wp-config.php not found"), v.npos) << v;

	root.WriteFile("site/wp-config.php", "<?php\n", 0644);
	EXPECT_EQ(Violation(MakeRecord(site)), "");

	ASSERT_EQ(unlink(config.c_str()), 0);
	ASSERT_EQ(mkdir(config.c_str(), 0755), 0);
	EXPECT_NE(Violation(MakeRecord(site)).find("wp-config.php not found"),
		  std::string::npos);
}

TEST_F(PolicyTest, ValidateSites)
{
	const auto second = MakeSite("second");

	std::vector<SiteRecord> records{
		MakeRecord(site),
		MakeRecord("/etc"),
		MakeRecord(second),
	};
	records[1].line = 2;
	records[2].line = 3;

	CaptureLog log;
	const auto result = ValidateSites(policy, std::move(records), log);

	ASSERT_EQ(result.admitted.size(), 2u);
	EXPECT_EQ(result.admitted[0].real_path, site);
	EXPECT_EQ(result.admitted[1].real_path, second);

	ASSERT_EQ(result.blocked.size(), 1u);
	EXPECT_EQ(result.blocked[0].status, JobStatus::SECURITY_BLOCKED);
	EXPECT_EQ(result.blocked[0].path, "/etc");
	EXPECT_EQ(result.blocked[0].line, 2u);
}

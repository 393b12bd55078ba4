#include "dispatch/Command.hxx"
#include "dispatch/Config.hxx"
#include "site/Record.hxx"

#include <gtest/gtest.h>

static AdmittedSite
MakeSite(SiteMethod method)
{
	return {
		.record = {
			.path = "/var/www/link",
			.owner = "alice",
			.method = method,
			.line = 1,
		},
		.real_path = "/var/www/example",
		.account = {
			.uid = 1000,
			.gid = 1000,
			.home = "/home/alice",
		},
	};
}

TEST(Command, WpCli)
{
	const DispatchConfig config;
	const auto c = MakeTaskCommand(config, MakeSite(SiteMethod::WP_CLI));

	const std::vector<std::string> expected{
		"/bin/php8.2",
		"/usr/local/bin/wp",
		"--path=/var/www/example",
		"cron", "event", "run", "--all",
		"--skip-plugins", "--skip-themes",
	};

	EXPECT_EQ(c.args, expected);
	EXPECT_EQ(c.chdir, "/var/www/example");
	EXPECT_EQ(c.home, "/home/alice");
}

TEST(Command, PhpDirect)
{
	DispatchConfig config;
	config.php = "/usr/bin/php";

	const auto c = MakeTaskCommand(config, MakeSite(SiteMethod::PHP_DIRECT));

	const std::vector<std::string> expected{
		"/usr/bin/php",
		"/var/www/example/wp-cron.php",
	};

	EXPECT_EQ(c.args, expected);
	EXPECT_EQ(c.chdir, "/var/www/example");
}

#include "site/Registry.hxx"
#include "CaptureLog.hxx"
#include "TempDir.hxx"

#include <gtest/gtest.h>

#include <sys/stat.h>
#include <unistd.h>

using std::string_view_literals::operator""sv;

TEST(Registry, Parse)
{
	const auto r = ParseRegistry(
		"# comment\n"
		"\n"
		"/var/www/a|alice|wp-cli\n"
		"  /home/bob/site | bob | php-direct \r\n"
		"   # indented comment\n"
		"/var/www/c|carol|wp-cli"sv,
		1000);

	EXPECT_EQ(r.n_entries, 3u);
	EXPECT_TRUE(r.invalid.empty());
	ASSERT_EQ(r.records.size(), 3u);

	EXPECT_EQ(r.records[0].path, "/var/www/a");
	EXPECT_EQ(r.records[0].owner, "alice");
	EXPECT_EQ(r.records[0].method, SiteMethod::WP_CLI);
	EXPECT_EQ(r.records[0].line, 3u);

	EXPECT_EQ(r.records[1].path, "/home/bob/site");
	EXPECT_EQ(r.records[1].owner, "bob");
	EXPECT_EQ(r.records[1].method, SiteMethod::PHP_DIRECT);
	EXPECT_EQ(r.records[1].line, 4u);

	EXPECT_EQ(r.records[2].path, "/var/www/c");
	EXPECT_EQ(r.records[2].line, 6u);
}

TEST(Registry, Empty)
{
	const auto r = ParseRegistry("# nothing here\n\n   \n"sv, 1000);
	EXPECT_EQ(r.n_entries, 0u);
	EXPECT_TRUE(r.records.empty());
	EXPECT_TRUE(r.invalid.empty());
}

TEST(Registry, Malformed)
{
	const auto r = ParseRegistry(
		"/var/www/a|alice\n"
		"/var/www/b|bob|wp-cli|extra\n"
		"/var/www/c||wp-cli\n"
		"/var/www/d|dave|cgi\n"
		"/var/www/e|eve|wp-cli\n"sv,
		1000);

	EXPECT_EQ(r.n_entries, 5u);
	ASSERT_EQ(r.records.size(), 1u);
	EXPECT_EQ(r.records[0].path, "/var/www/e");

	ASSERT_EQ(r.invalid.size(), 4u);
	for (const auto &i : r.invalid) {
		EXPECT_EQ(i.status, JobStatus::CONFIG_INVALID);
		EXPECT_FALSE(i.method.has_value());
		EXPECT_FALSE(i.detail.empty());
	}

	EXPECT_EQ(r.invalid[0].line, 1u);
	EXPECT_EQ(r.invalid[1].line, 2u);
	EXPECT_EQ(r.invalid[2].line, 3u);
	EXPECT_EQ(r.invalid[3].line, 4u);
	EXPECT_EQ(r.invalid[3].path, "/var/www/d");
	EXPECT_NE(r.invalid[3].detail.find("cgi"), std::string::npos);
}

TEST(Registry, Duplicate)
{
	const auto r = ParseRegistry(
		"/var/www/a|alice|wp-cli\n"
		"/var/www/b|bob|wp-cli\n"
		"/var/www/a|mallory|php-direct\n"sv,
		1000);

	EXPECT_EQ(r.n_entries, 3u);
	ASSERT_EQ(r.records.size(), 2u);
	EXPECT_EQ(r.records[0].owner, "alice");
	EXPECT_EQ(r.records[1].owner, "bob");

	ASSERT_EQ(r.invalid.size(), 1u);
	EXPECT_EQ(r.invalid[0].status, JobStatus::CONFIG_INVALID);
	EXPECT_EQ(r.invalid[0].path, "/var/www/a");
	EXPECT_EQ(r.invalid[0].owner, "mallory");
	EXPECT_EQ(r.invalid[0].line, 3u);
}

static std::string
MakeEntries(unsigned n)
{
	std::string text;
	for (unsigned i = 0; i < n; ++i)
		text += "/var/www/site" + std::to_string(i) + "|user|wp-cli\n";
	return text;
}

TEST(Registry, TooManyEntries)
{
	EXPECT_EQ(ParseRegistry(MakeEntries(1000), 1000).records.size(), 1000u);

	try {
		ParseRegistry(MakeEntries(1500), 1000);
		FAIL() << "No exception thrown";
	} catch (const ConfigError &e) {
		EXPECT_EQ(e.GetCode(), ConfigError::Code::TOO_MANY_ENTRIES);
	}

	/* comments don't count */
	EXPECT_NO_THROW(ParseRegistry("# a\n# b\n/var/www/x|u|wp-cli\n"sv, 1));
}

static RegistryConfig
MakeRegistryConfig(const std::string &path)
{
	RegistryConfig config;
	config.path = path;
	config.trusted_uid = geteuid();
	return config;
}

static ConfigError::Code
LoadRegistryError(const RegistryConfig &config)
{
	CaptureLog log;

	try {
		LoadRegistry(config, log);
	} catch (const ConfigError &e) {
		return e.GetCode();
	}

	throw std::runtime_error{"No ConfigError"};
}

TEST(Registry, Load)
{
	const TempDir dir;
	const auto path = dir.WriteFile("sites.conf",
					"/var/www/a|alice|wp-cli\n"
					"/var/www/b|bob|php-direct\n");

	CaptureLog log;
	const auto r = LoadRegistry(MakeRegistryConfig(path), log);
	EXPECT_EQ(r.records.size(), 2u);
	EXPECT_TRUE(log.lines.empty());
}

TEST(Registry, NotFound)
{
	const TempDir dir;
	EXPECT_EQ(LoadRegistryError(MakeRegistryConfig(dir.Child("missing.conf"))),
		  ConfigError::Code::NOT_FOUND);
}

TEST(Registry, UntrustedOwner)
{
	const TempDir dir;
	auto config = MakeRegistryConfig(dir.WriteFile("sites.conf",
						       "/var/www/a|alice|wp-cli\n"));
	config.trusted_uid = geteuid() + 1;

	EXPECT_EQ(LoadRegistryError(config),
		  ConfigError::Code::UNTRUSTED_OWNER);
}

TEST(Registry, TooLarge)
{
	const TempDir dir;
	const std::string comment(2 * 1024 * 1024, '#');
	const auto path = dir.WriteFile("sites.conf", comment);

	EXPECT_EQ(LoadRegistryError(MakeRegistryConfig(path)),
		  ConfigError::Code::TOO_LARGE);
}

TEST(Registry, TooManyEntriesFile)
{
	const TempDir dir;
	const auto path = dir.WriteFile("sites.conf", MakeEntries(1500));

	EXPECT_EQ(LoadRegistryError(MakeRegistryConfig(path)),
		  ConfigError::Code::TOO_MANY_ENTRIES);
}

static mode_t
GetMode(const std::string &path)
{
	struct stat st;
	if (stat(path.c_str(), &st) < 0)
		throw std::runtime_error{"stat() failed"};
	return st.st_mode & 07777;
}

TEST(Registry, LooseMode)
{
	const TempDir dir;
	const auto path = dir.WriteFile("sites.conf",
					"/var/www/a|alice|wp-cli\n",
					0644);
	ASSERT_EQ(GetMode(path), 0644u);

	CaptureLog log;
	const auto r = LoadRegistry(MakeRegistryConfig(path), log);
	EXPECT_EQ(r.records.size(), 1u);

	EXPECT_EQ(GetMode(path), 0600u);
	ASSERT_EQ(log.lines.size(), 1u);
	EXPECT_EQ(log.lines.front().priority, LOG_WARNING);
	EXPECT_TRUE(log.Contains("644"));
}

TEST(Registry, NeverLoosened)
{
	const TempDir dir;
	const auto path = dir.WriteFile("sites.conf",
					"/var/www/a|alice|wp-cli\n",
					0400);

	CaptureLog log;
	LoadRegistry(MakeRegistryConfig(path), log);

	EXPECT_EQ(GetMode(path), 0400u);
	EXPECT_TRUE(log.lines.empty());
}

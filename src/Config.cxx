// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"
#include "debug.h"
#include "lib/fmt/RuntimeError.hxx"
#include "io/FileLineParser.hxx"
#include "io/ConfigParser.hxx"
#include "util/StringParser.hxx"

#include <chrono>

#include <errno.h>
#include <pwd.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

Config::Config()
{
	if (debug_mode)
		spawn.default_uid_gid.LoadEffective();
}

static uid_t
LookupUid(const char *user)
{
	const struct passwd *pw = getpwnam(user);
	if (pw == nullptr)
		throw FmtRuntimeError("No such user: {}", user);

	return pw->pw_uid;
}

static void
CheckExecutable(const std::string &path, const char *name)
{
	if (path.empty() || path.front() != '/')
		throw FmtRuntimeError("'{}' must be an absolute path", name);

	struct stat st;
	if (stat(path.c_str(), &st) < 0 || !S_ISREG(st.st_mode))
		throw FmtRuntimeError("'{}' not found: {}", name, path);
}

void
Config::Check()
{
	if (debug_mode)
		/* running unprivileged: the registry may be owned by
		   the current user */
		registry.trusted_uid = geteuid();
	else
		registry.trusted_uid = LookupUid(trusted_user.c_str());

	if (policy.allowed_roots.empty())
		throw std::runtime_error("No 'allowed_root'");

	for (const auto &i : policy.allowed_roots)
		if (i.empty() || i.front() != '/')
			throw FmtRuntimeError("'allowed_root' must be absolute: {}", i);

	CheckExecutable(dispatch.php, "php");

	if (registry.path.empty() || registry.path.front() != '/')
		throw std::runtime_error("'registry' must be an absolute path");

	if (dispatch.concurrency == 0)
		throw std::runtime_error("'concurrency' must be positive");

	if (debug_mode)
		/* accept gid=0 (keep current gid) if started as an
		   unprivileged user */
		spawn.allowed_gids.insert(0);
}

class RunnerConfigParser final : public ConfigParser {
	Config &config;

	/**
	 * Has an "allowed_root" line been seen already?  The first
	 * one replaces the built-in list.
	 */
	bool have_allowed_root = false;

public:
	explicit RunnerConfigParser(Config &_config)
		:config(_config) {}

protected:
	/* virtual methods from class ConfigParser */
	void ParseLine(FileLineParser &line) override;
};

static std::chrono::seconds
ParseSeconds(const char *s, long max)
{
	return std::chrono::seconds(ParsePositiveLong(s, max));
}

void
RunnerConfigParser::ParseLine(FileLineParser &line)
{
	const char *word = line.ExpectWord();

	if (strcmp(word, "registry") == 0) {
		config.registry.path = line.ExpectValueAndEnd();
	} else if (strcmp(word, "trusted_user") == 0) {
		config.trusted_user = line.ExpectValueAndEnd();
	} else if (strcmp(word, "max_entries") == 0) {
		config.registry.max_entries = ParsePositiveLong(line.ExpectValueAndEnd(),
								1000000);
	} else if (strcmp(word, "allowed_root") == 0) {
		if (!have_allowed_root) {
			config.policy.allowed_roots.clear();
			have_allowed_root = true;
		}

		config.policy.allowed_roots.emplace_back(line.ExpectValueAndEnd());
	} else if (strcmp(word, "deny_user") == 0) {
		config.policy.denied_users.emplace_back(line.ExpectValueAndEnd());
	} else if (strcmp(word, "php") == 0) {
		config.dispatch.php = line.ExpectValueAndEnd();
	} else if (strcmp(word, "wp_cli") == 0) {
		config.dispatch.wp_cli = line.ExpectValueAndEnd();
	} else if (strcmp(word, "concurrency") == 0) {
		config.dispatch.concurrency = ParsePositiveLong(line.ExpectValueAndEnd(),
								256);
	} else if (strcmp(word, "launch_delay_ms") == 0) {
		const char *value = line.ExpectValueAndEnd();
		config.dispatch.launch_delay = strcmp(value, "0") == 0
			? Event::Duration::zero()
			: std::chrono::milliseconds(ParsePositiveLong(value, 60000));
	} else if (strcmp(word, "throttle_backoff") == 0) {
		config.dispatch.throttle_backoff = ParseSeconds(line.ExpectValueAndEnd(),
								3600);
	} else if (strcmp(word, "timeout") == 0) {
		config.dispatch.timeout = ParseSeconds(line.ExpectValueAndEnd(),
						       86400);
	} else if (strcmp(word, "kill_grace") == 0) {
		config.dispatch.kill_grace = ParseSeconds(line.ExpectValueAndEnd(),
							  3600);
	} else if (strcmp(word, "cpu_threshold") == 0) {
		config.throttle.cpu_threshold = ParsePositiveLong(line.ExpectValueAndEnd(),
								  100);
	} else if (strcmp(word, "load_factor") == 0) {
		config.throttle.load_factor = ParsePositiveLong(line.ExpectValueAndEnd(),
								1024);
	} else if (strcmp(word, "cpu_sample_ms") == 0) {
		config.throttle.cpu_sample_interval =
			std::chrono::milliseconds(ParsePositiveLong(line.ExpectValueAndEnd(),
								    10000));
	} else if (strcmp(word, "syslog_tag") == 0) {
		config.syslog_tag = line.ExpectValueAndEnd();
	} else if (strcmp(word, "syslog_server") == 0) {
		config.syslog_server = line.ExpectValueAndEnd();
	} else
		throw LineParser::Error("Unknown option");
}

void
LoadConfigFile(Config &config, const char *path)
{
	if (access(path, F_OK) < 0 && errno == ENOENT)
		return;

	RunnerConfigParser parser(config);
	VariableConfigParser v_parser(parser);
	CommentConfigParser parser2(v_parser);
	IncludeConfigParser parser3(path, parser2);

	ParseConfigFile(path, parser3);
}

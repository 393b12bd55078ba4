// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Record.hxx"
#include "report/Outcome.hxx"

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

class LogSink;

struct PolicyConfig {
	/**
	 * Site paths must be inside one of these directories, both
	 * literally and after resolving symlinks.
	 */
	std::vector<std::string> allowed_roots{"/var/www", "/home"};

	/**
	 * System and service accounts which may never run a task
	 * handler.  A trailing '*' matches any name with that prefix.
	 */
	std::vector<std::string> denied_users{
		"root", "bin", "daemon", "sys", "sync", "games", "man",
		"lp", "mail", "news", "uucp", "proxy", "backup", "list",
		"irc", "gnats", "nobody", "messagebus", "syslog",
		"_*", "systemd-*",
	};

	/**
	 * Login shells which mark an account as disabled.
	 */
	std::vector<std::string> disabled_shells{
		"/sbin/nologin", "/usr/sbin/nologin", "/bin/false",
	};

	/**
	 * Login shells which are accepted silently; any other shell
	 * is accepted with a warning.
	 */
	std::vector<std::string> known_shells{
		"/bin/bash", "/bin/sh", "/bin/dash", "/usr/bin/fish", "/bin/zsh",
	};
};

/**
 * A registry entry was rejected by the security policy.  The
 * message describes the check which failed.
 */
class SecurityViolation : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * Is #path equal to #root or a path below it?
 */
[[gnu::pure]]
bool
IsBelowRoot(std::string_view path, std::string_view root) noexcept;

[[gnu::pure]]
bool
IsBelowAllowedRoot(const PolicyConfig &policy, std::string_view path) noexcept;

/**
 * Is this user name on the denylist?
 */
[[gnu::pure]]
bool
IsDeniedUser(const PolicyConfig &policy, std::string_view user) noexcept;

/**
 * Run all security checks on one registry entry.  Warnings (e.g. an
 * unusual login shell) are written to #log.
 *
 * Throws #SecurityViolation if the entry must not be executed.
 */
AdmittedSite
ValidateSite(const PolicyConfig &policy, const SiteRecord &record,
	     LogSink &log);

struct ValidatedSites {
	std::vector<AdmittedSite> admitted;

	/**
	 * One #JobStatus::SECURITY_BLOCKED outcome per rejected
	 * entry.
	 */
	std::vector<JobOutcome> blocked;
};

/**
 * Run ValidateSite() on each record.  A rejected record never
 * affects the others.
 */
ValidatedSites
ValidateSites(const PolicyConfig &policy, std::vector<SiteRecord> &&records,
	      LogSink &log);

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Policy.hxx"
#include "report/LogSink.hxx"

#include <fmt/core.h>

#include <algorithm>
#include <filesystem>

#include <grp.h>
#include <pwd.h>
#include <sys/stat.h>

using std::string_view_literals::operator""sv;

bool
IsBelowRoot(std::string_view path, std::string_view root) noexcept
{
	while (root.size() > 1 && root.back() == '/')
		root.remove_suffix(1);

	if (!path.starts_with(root))
		return false;

	path.remove_prefix(root.size());
	return path.empty() || path.front() == '/' || root == "/"sv;
}

bool
IsBelowAllowedRoot(const PolicyConfig &policy, std::string_view path) noexcept
{
	return std::any_of(policy.allowed_roots.begin(),
			   policy.allowed_roots.end(),
			   [path](const std::string &root){
				   return IsBelowRoot(path, root);
			   });
}

bool
IsDeniedUser(const PolicyConfig &policy, std::string_view user) noexcept
{
	for (std::string_view pattern : policy.denied_users) {
		if (pattern.ends_with('*')) {
			pattern.remove_suffix(1);
			if (user.starts_with(pattern))
				return true;
		} else if (user == pattern)
			return true;
	}

	return false;
}

[[gnu::pure]]
static bool
Contains(const std::vector<std::string> &list, std::string_view value) noexcept
{
	return std::find(list.begin(), list.end(), value) != list.end();
}

static std::vector<gid_t>
GetUserGroups(const char *user, gid_t gid)
{
	std::vector<gid_t> groups(64);

	while (true) {
		int ngroups = groups.size();
		if (getgrouplist(user, gid, groups.data(), &ngroups) >= 0) {
			groups.resize(ngroups);
			return groups;
		}

		if (std::size_t(ngroups) <= groups.size())
			throw SecurityViolation(fmt::format("Failed to look up groups of user {}",
							    user));

		groups.resize(ngroups);
	}
}

static SiteAccount
CheckUser(const PolicyConfig &policy, const std::string &user, LogSink &log)
{
	if (IsDeniedUser(policy, user))
		throw SecurityViolation(fmt::format("Blocked execution for system user: {}",
						    user));

	const struct passwd *pw = getpwnam(user.c_str());
	if (pw == nullptr)
		throw SecurityViolation(fmt::format("User not found: {}", user));

	if (pw->pw_uid == 0)
		throw SecurityViolation(fmt::format("User {} has uid 0", user));

	const std::string_view shell = pw->pw_shell != nullptr
		? std::string_view{pw->pw_shell}
		: std::string_view{};

	if (Contains(policy.disabled_shells, shell))
		throw SecurityViolation(fmt::format("User has disabled shell: {} ({})",
						    user, shell));

	if (!Contains(policy.known_shells, shell))
		log.Log(LOG_WARNING,
			fmt::format("WARNING: User has unusual shell: {} ({})",
				    user, shell));

	SiteAccount account{
		.uid = pw->pw_uid,
		.gid = pw->pw_gid,
		.home = pw->pw_dir != nullptr ? pw->pw_dir : "",
	};

	account.groups = GetUserGroups(user.c_str(), account.gid);
	if (std::find(account.groups.begin(), account.groups.end(),
		      gid_t(0)) != account.groups.end())
		throw SecurityViolation(fmt::format("User {} is a member of group 0",
						    user));

	return account;
}

static bool
IsRegularFile(const std::string &path) noexcept
{
	struct stat st;
	return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

AdmittedSite
ValidateSite(const PolicyConfig &policy, const SiteRecord &record,
	     LogSink &log)
{
	const std::string &path = record.path;

	if (path.find(".."sv) != path.npos)
		throw SecurityViolation(fmt::format("Path traversal attempt blocked: {}",
						    path));

	if (!IsBelowAllowedRoot(policy, path))
		throw SecurityViolation(fmt::format("Path outside allowed directories blocked: {}",
						    path));

	std::error_code ec;
	const auto canonical = std::filesystem::canonical(path, ec);
	if (ec)
		throw SecurityViolation(fmt::format("Invalid path blocked: {} ({})",
						    path, ec.message()));

	std::string real_path = canonical.string();
	if (!IsBelowAllowedRoot(policy, real_path))
		throw SecurityViolation(fmt::format("Resolved path outside allowed directories blocked: {}",
						    real_path));

	auto account = CheckUser(policy, record.owner, log);

	if (!IsRegularFile(real_path + "/wp-config.php"))
		throw SecurityViolation(fmt::format("wp-config.php not found in {}",
						    real_path));

	struct stat st;
	if (stat(real_path.c_str(), &st) < 0)
		throw SecurityViolation(fmt::format("Failed to stat {}", real_path));

	if (st.st_uid != account.uid)
		throw SecurityViolation(fmt::format("Directory owner mismatch - path: {}, expected: {} (uid {}), actual uid: {}",
						    real_path, record.owner,
						    account.uid, st.st_uid));

	switch (record.method) {
	case SiteMethod::WP_CLI:
		break;

	case SiteMethod::PHP_DIRECT:
		if (!IsRegularFile(real_path + "/wp-cron.php"))
			throw SecurityViolation(fmt::format("wp-cron.php not found in {}",
							    real_path));
		break;
	}

	return {
		.record = record,
		.real_path = std::move(real_path),
		.account = std::move(account),
	};
}

ValidatedSites
ValidateSites(const PolicyConfig &policy, std::vector<SiteRecord> &&records,
	      LogSink &log)
{
	ValidatedSites result;
	result.admitted.reserve(records.size());

	for (auto &record : records) {
		try {
			result.admitted.emplace_back(ValidateSite(policy, record, log));
		} catch (const SecurityViolation &e) {
			result.blocked.emplace_back(JobOutcome::Blocked(record,
									e.what()));
		}
	}

	return result;
}

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include <pwd.h>
#include <unistd.h>

struct TestAccount {
	std::string name;
	uid_t uid;
	gid_t gid;
	std::string shell;
};

static inline TestAccount
MakeTestAccount(const struct passwd &pw)
{
	return {pw.pw_name, pw.pw_uid, pw.pw_gid,
		pw.pw_shell != nullptr ? pw.pw_shell : ""};
}

/**
 * The account which owns the test sites.  When running as root, this
 * is "nobody" (and the test must chown() the sites to it), because
 * sites owned by root are always rejected.
 */
static inline std::optional<TestAccount>
FindTestAccount() noexcept
{
	const struct passwd *pw = geteuid() != 0
		? getpwuid(geteuid())
		: getpwnam("nobody");
	if (pw == nullptr)
		return std::nullopt;

	return MakeTestAccount(*pw);
}

/**
 * Find an account which is neither root nor the given one.
 */
static inline std::optional<TestAccount>
FindOtherAccount(uid_t exclude) noexcept
{
	std::optional<TestAccount> result;

	setpwent();
	while (const struct passwd *pw = getpwent()) {
		if (pw->pw_uid != 0 && pw->pw_uid != exclude) {
			result = MakeTestAccount(*pw);
			break;
		}
	}
	endpwent();

	return result;
}

/**
 * Give the file to the test account (only needed when running as
 * root).
 */
static inline void
ChownToTestAccount(const std::string &path, const TestAccount &account)
{
	if (geteuid() == 0 && chown(path.c_str(), account.uid, account.gid) < 0)
		throw std::runtime_error{"chown() failed"};
}

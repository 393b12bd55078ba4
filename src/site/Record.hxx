// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Method.hxx"

#include <string>
#include <vector>

#include <sys/types.h>

/**
 * One line of the site registry.
 */
struct SiteRecord {
	std::string path, owner;

	SiteMethod method;

	/**
	 * The line number in the registry file (1-based).
	 */
	unsigned line = 0;
};

/**
 * The account a #SiteRecord was validated against.
 */
struct SiteAccount {
	uid_t uid;
	gid_t gid;

	std::vector<gid_t> groups;

	std::string home;
};

/**
 * A #SiteRecord which has passed all policy checks.  The task
 * handler runs with the values resolved during validation, not
 * with a fresh lookup.
 */
struct AdmittedSite {
	SiteRecord record;

	/**
	 * The canonical path (after realpath()).
	 */
	std::string real_path;

	SiteAccount account;
};

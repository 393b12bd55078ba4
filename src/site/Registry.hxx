// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Record.hxx"
#include "report/Outcome.hxx"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

class LogSink;

struct RegistryConfig {
	std::string path = "/etc/wordpress-sites.conf";

	/**
	 * The registry file must be owned by this user.
	 */
	uid_t trusted_uid = 0;

	/**
	 * Refuse to run if the registry has more active entries.
	 */
	std::size_t max_entries = 1000;
};

/**
 * A problem with the registry file as a whole.  The run is aborted
 * before any job is started.
 */
class ConfigError : public std::runtime_error {
public:
	enum class Code {
		NOT_FOUND,
		UNTRUSTED_OWNER,
		TOO_MANY_ENTRIES,
		TOO_LARGE,
	};

private:
	Code code;

public:
	ConfigError(Code _code, const std::string &msg)
		:std::runtime_error(msg), code(_code) {}

	Code GetCode() const noexcept {
		return code;
	}
};

struct LoadedRegistry {
	/**
	 * Well-formed entries in registry order.
	 */
	std::vector<SiteRecord> records;

	/**
	 * Malformed entries (#JobStatus::CONFIG_INVALID).
	 */
	std::vector<JobOutcome> invalid;

	/**
	 * The number of active (non-comment, non-blank) lines.
	 */
	std::size_t n_entries = 0;
};

/**
 * Parse the contents of a registry file.  Malformed lines are
 * reported in #LoadedRegistry::invalid; a path which was already
 * listed is rejected as a duplicate.
 *
 * Throws #ConfigError if there are more than #max_entries active
 * lines.
 */
LoadedRegistry
ParseRegistry(std::string_view text, std::size_t max_entries);

/**
 * Open the registry, verify its owner and permissions (tightening
 * them if they are too loose) and parse it.
 *
 * Throws #ConfigError on a fatal registry problem, and
 * std::system_error on I/O errors.
 */
LoadedRegistry
LoadRegistry(const RegistryConfig &config, LogSink &log);

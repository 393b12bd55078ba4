// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "site/Method.hxx"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

struct SiteRecord;

enum class JobStatus : uint_least8_t {
	SUCCESS,
	FAILURE,
	SECURITY_BLOCKED,
	CONFIG_INVALID,
};

/**
 * The keyword used for this status in log lines.
 */
[[gnu::const]]
std::string_view
ToString(JobStatus status) noexcept;

/**
 * The result of one registry entry.  It is created once (when the
 * entry was rejected or its task handler has finished) and never
 * modified afterwards.
 */
struct JobOutcome {
	JobStatus status;

	std::string path, owner;

	/**
	 * Not set if the registry line did not contain a valid
	 * method.
	 */
	std::optional<SiteMethod> method;

	std::chrono::duration<double> duration{};

	/**
	 * Human-readable reason (which check failed, why the job
	 * failed).  Empty on success.
	 */
	std::string detail;

	unsigned line = 0;

	std::chrono::system_clock::time_point timestamp =
		std::chrono::system_clock::now();

	static JobOutcome Success(const SiteRecord &record,
				  std::chrono::duration<double> duration) noexcept;

	static JobOutcome Failure(const SiteRecord &record,
				  std::chrono::duration<double> duration,
				  std::string &&detail) noexcept;

	static JobOutcome Blocked(const SiteRecord &record,
				  std::string &&detail) noexcept;

	static JobOutcome Invalid(unsigned line, std::string_view path,
				  std::string_view owner,
				  std::string &&detail) noexcept;
};

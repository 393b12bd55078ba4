// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <cstddef>
#include <string>

struct JobOutcome;
class LogSink;

struct RunSummary {
	std::size_t total = 0;
	std::size_t success = 0, failure = 0, blocked = 0, invalid = 0;

	std::chrono::duration<double> duration{};

	/**
	 * Was the number of security-blocked entries suspiciously
	 * high?
	 */
	bool alert = false;
};

/**
 * Format the log line describing one outcome.
 */
std::string
FormatOutcome(const JobOutcome &outcome);

/**
 * Is the number of blocked entries high enough to raise an alert
 * (more than 10% of all entries)?
 */
[[gnu::const]]
constexpr bool
IsBlockedRatioAnomalous(std::size_t blocked, std::size_t total) noexcept
{
	return blocked * 10 > total;
}

/**
 * Collects all #JobOutcome instances of a run, writes one log line
 * for each and the summary at the end.
 */
class OutcomeAggregator {
	LogSink &log;

	RunSummary summary;

public:
	explicit OutcomeAggregator(LogSink &_log) noexcept
		:log(_log) {}

	const RunSummary &GetSummary() const noexcept {
		return summary;
	}

	void Add(const JobOutcome &outcome) noexcept;

	/**
	 * Log the summary (and the alert line if applicable).
	 *
	 * @param duration the wall-clock duration of the whole run
	 */
	RunSummary Finish(std::chrono::duration<double> duration) noexcept;
};

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Aggregator.hxx"
#include "Outcome.hxx"
#include "LogSink.hxx"

#include <fmt/format.h>

#include <iterator>

using std::string_view_literals::operator""sv;

[[gnu::pure]]
static std::string_view
OrUnknown(std::string_view value) noexcept
{
	return value.empty() ? "?"sv : value;
}

std::string
FormatOutcome(const JobOutcome &outcome)
{
	fmt::memory_buffer buffer;
	auto out = std::back_inserter(buffer);

	out = fmt::format_to(out, "{}: ", ToString(outcome.status));

	if (outcome.status == JobStatus::CONFIG_INVALID)
		out = fmt::format_to(out, "registry line {}: ", outcome.line);

	out = fmt::format_to(out, "{} ({:.0f}s, {}, user: {})",
			     OrUnknown(outcome.path),
			     outcome.duration.count(),
			     outcome.method
			     ? ToString(*outcome.method)
			     : "?"sv,
			     OrUnknown(outcome.owner));

	if (!outcome.detail.empty())
		out = fmt::format_to(out, " - {}", outcome.detail);

	return fmt::to_string(buffer);
}

[[gnu::const]]
static int
GetPriority(JobStatus status) noexcept
{
	switch (status) {
	case JobStatus::SUCCESS:
		return LOG_INFO;

	case JobStatus::SECURITY_BLOCKED:
		return LOG_NOTICE;

	case JobStatus::FAILURE:
	case JobStatus::CONFIG_INVALID:
		return LOG_WARNING;
	}

	return LOG_WARNING;
}

void
OutcomeAggregator::Add(const JobOutcome &outcome) noexcept
{
	++summary.total;

	switch (outcome.status) {
	case JobStatus::SUCCESS:
		++summary.success;
		break;

	case JobStatus::FAILURE:
		++summary.failure;
		break;

	case JobStatus::SECURITY_BLOCKED:
		++summary.blocked;
		break;

	case JobStatus::CONFIG_INVALID:
		++summary.invalid;
		break;
	}

	log.Log(GetPriority(outcome.status), FormatOutcome(outcome));
}

RunSummary
OutcomeAggregator::Finish(std::chrono::duration<double> duration) noexcept
{
	summary.duration = duration;
	summary.alert = IsBlockedRatioAnomalous(summary.blocked, summary.total);

	log.Log(LOG_INFO,
		fmt::format("INFO: Cron run completed in {:.0f}s - Success: {}, Failed: {}, Security Blocked: {}, Invalid: {}, Total Sites: {}",
			    duration.count(),
			    summary.success, summary.failure,
			    summary.blocked, summary.invalid,
			    summary.total));

	if (summary.alert)
		log.Log(LOG_ALERT,
			fmt::format("ALERT: High number of security blocks ({} of {}). Possible attack or config issues.",
				    summary.blocked, summary.total));

	return summary;
}

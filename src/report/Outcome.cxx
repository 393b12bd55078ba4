// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Outcome.hxx"
#include "site/Record.hxx"

using std::string_view_literals::operator""sv;

std::string_view
ToString(JobStatus status) noexcept
{
	switch (status) {
	case JobStatus::SUCCESS:
		return "SUCCESS"sv;

	case JobStatus::FAILURE:
		return "FAILED"sv;

	case JobStatus::SECURITY_BLOCKED:
		return "SECURITY"sv;

	case JobStatus::CONFIG_INVALID:
		return "INVALID"sv;
	}

	return {};
}

static JobOutcome
MakeOutcome(JobStatus status, const SiteRecord &record,
	    std::chrono::duration<double> duration,
	    std::string &&detail) noexcept
{
	return {
		.status = status,
		.path = record.path,
		.owner = record.owner,
		.method = record.method,
		.duration = duration,
		.detail = std::move(detail),
		.line = record.line,
	};
}

JobOutcome
JobOutcome::Success(const SiteRecord &record,
		    std::chrono::duration<double> duration) noexcept
{
	return MakeOutcome(JobStatus::SUCCESS, record, duration, {});
}

JobOutcome
JobOutcome::Failure(const SiteRecord &record,
		    std::chrono::duration<double> duration,
		    std::string &&detail) noexcept
{
	return MakeOutcome(JobStatus::FAILURE, record, duration,
			   std::move(detail));
}

JobOutcome
JobOutcome::Blocked(const SiteRecord &record, std::string &&detail) noexcept
{
	return MakeOutcome(JobStatus::SECURITY_BLOCKED, record, {},
			   std::move(detail));
}

JobOutcome
JobOutcome::Invalid(unsigned line, std::string_view path,
		    std::string_view owner, std::string &&detail) noexcept
{
	return {
		.status = JobStatus::CONFIG_INVALID,
		.path = std::string{path},
		.owner = std::string{owner},
		.detail = std::move(detail),
		.line = line,
	};
}

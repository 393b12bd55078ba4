// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "RunLog.hxx"
#include "SyslogClient.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"

#include <fmt/chrono.h>
#include <fmt/core.h>

#include <string.h>
#include <syslog.h>

RunLog::RunLog(std::unique_ptr<SyslogClient> _syslog, FILE *_out) noexcept
	:syslog(std::move(_syslog)), out(_out) {}

RunLog::~RunLog() noexcept = default;

std::unique_ptr<RunLog>
RunLog::Open(const char *syslog_server, const char *tag, FILE *_out)
{
	std::unique_ptr<SyslogClient> syslog;

	try {
		syslog = std::make_unique<SyslogClient>(syslog_server, tag,
							LOG_FAC(LOG_CRON));
	} catch (...) {
		Logger{"log"}.Fmt(1, "Failed to connect to syslog {:?}: {}",
				  syslog_server, std::current_exception());
	}

	return std::make_unique<RunLog>(std::move(syslog), _out);
}

void
RunLog::Log(int priority, std::string_view message) noexcept
{
	if (syslog) {
		if (int e = syslog->Log(priority, message); e != 0)
			logger.Fmt(2, "syslog failed: {}",
				   e > 0 ? strerror(e) : "short write");
	}

	const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
	fmt::print(out, "{:%Y-%m-%d %H:%M:%S} {}\n",
		   fmt::localtime(now), message);
	fflush(out);
}

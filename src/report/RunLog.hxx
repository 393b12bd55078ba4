// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "LogSink.hxx"
#include "io/Logger.hxx"

#include <cstdio>
#include <memory>

class SyslogClient;

/**
 * The audit log of a run: each message is sent to syslog and
 * printed (with a timestamp) on stdout.
 */
class RunLog final : public LogSink {
	const Logger logger{"log"};

	std::unique_ptr<SyslogClient> syslog;

	FILE *const out;

public:
	/**
	 * @param _syslog may be nullptr (then only #_out is used)
	 */
	RunLog(std::unique_ptr<SyslogClient> _syslog, FILE *_out) noexcept;
	~RunLog() noexcept;

	/**
	 * Connect to the given syslog server.  If that fails, the
	 * error is logged and only #_out is used.
	 */
	static std::unique_ptr<RunLog> Open(const char *syslog_server,
					    const char *tag, FILE *_out);

	/* virtual methods from LogSink */
	void Log(int priority, std::string_view message) noexcept override;
};

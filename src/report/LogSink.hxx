// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string_view>

#include <syslog.h> // for the LOG_* priorities

/**
 * Destination for the audit log of a run: one line per job outcome,
 * throttle event, warning and summary.
 */
class LogSink {
public:
	virtual ~LogSink() noexcept = default;

	/**
	 * @param priority a syslog priority (LOG_ALERT .. LOG_DEBUG)
	 */
	virtual void Log(int priority, std::string_view message) noexcept = 0;
};

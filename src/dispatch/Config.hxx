// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "event/Chrono.hxx"

#include <string>

struct DispatchConfig {
	/**
	 * The PHP CLI which runs all task handlers.
	 */
	std::string php = "/bin/php8.2";

	std::string wp_cli = "/usr/local/bin/wp";

	/**
	 * The maximum number of task handlers running at a time.
	 */
	unsigned concurrency = 5;

	/**
	 * The minimum time between two launches.
	 */
	Event::Duration launch_delay = std::chrono::milliseconds{500};

	/**
	 * How long to wait before measuring the system load again
	 * after it was found to be too high.
	 */
	Event::Duration throttle_backoff = std::chrono::seconds{5};

	/**
	 * Kill a task handler with SIGKILL after it has been running
	 * for this long.
	 */
	Event::Duration timeout = std::chrono::seconds{300};

	/**
	 * After a cancellation, send SIGKILL to task handlers which
	 * are still running after this duration.
	 */
	Event::Duration kill_grace = std::chrono::seconds{10};
};

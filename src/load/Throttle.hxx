// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

struct ThrottleConfig {
	/**
	 * Throttle if the CPU utilization (percent) is above this
	 * value.
	 */
	unsigned cpu_threshold = 80;

	/**
	 * Throttle if the 1-minute load average is above this many
	 * times the number of usable CPUs.
	 */
	unsigned load_factor = 2;

	/**
	 * The time between the two /proc/stat samples.
	 */
	std::chrono::milliseconds cpu_sample_interval{100};
};

struct ThrottleSignal {
	bool throttle = false;

	/**
	 * Names the metric which exceeded its threshold (empty if
	 * #throttle is false).
	 */
	std::string reason;
};

/**
 * Counters from the aggregate "cpu" line of /proc/stat (in
 * USER_HZ).
 */
struct CpuTimes {
	uint_least64_t total = 0;

	/**
	 * Idle plus iowait.
	 */
	uint_least64_t idle = 0;
};

/**
 * Parse the aggregate "cpu" line of /proc/stat.  Returns
 * std::nullopt if this is not such a line.
 */
[[gnu::pure]]
std::optional<CpuTimes>
ParseCpuTimes(std::string_view line) noexcept;

/**
 * Find and parse the "cpu" line in the contents of /proc/stat.
 */
[[gnu::pure]]
std::optional<CpuTimes>
FindCpuTimes(std::string_view text) noexcept;

/**
 * Calculate the CPU utilization between two samples in percent
 * (0..100).  Returns 0 if no time has passed.
 */
[[gnu::const]]
double
CalculateBusyPercent(const CpuTimes &before, const CpuTimes &after) noexcept;

/**
 * Parse the first (1-minute) field of /proc/loadavg.
 */
[[gnu::pure]]
std::optional<double>
ParseLoadAverage(std::string_view text) noexcept;

/**
 * Compare the measured values with the configured thresholds.
 *
 * @param n_cpus the number of CPUs available to this process
 */
ThrottleSignal
EvaluateThrottle(const ThrottleConfig &config,
		 double busy_percent, double load_average,
		 unsigned n_cpus) noexcept;

/**
 * The number of CPUs this process may run on (according to its
 * scheduler affinity mask); at least 1.
 */
unsigned
CountUsableCpus() noexcept;

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Throttle.hxx"
#include "util/IterableSplitString.hxx"
#include "util/NumberParser.hxx"
#include "util/StringCompare.hxx"
#include "util/StringStrip.hxx"

#include <fmt/core.h>

#include <charconv>

#include <sched.h>

using std::string_view_literals::operator""sv;

/* field indices after the "cpu" label; see proc(5) */
static constexpr std::size_t CPU_IDLE = 3, CPU_IOWAIT = 4;

/* guest and guest_nice are already included in user and nice */
static constexpr std::size_t CPU_N_ACCOUNTED = 8;

std::optional<CpuTimes>
ParseCpuTimes(std::string_view line) noexcept
{
	if (!SkipPrefix(line, "cpu "sv))
		return std::nullopt;

	CpuTimes times;
	std::size_t n = 0;

	for (std::string_view field : IterableSplitString(line, ' ')) {
		if (field.empty())
			continue;

		if (n >= CPU_N_ACCOUNTED)
			break;

		const auto value = ParseInteger<uint_least64_t>(field);
		if (!value)
			return std::nullopt;

		times.total += *value;
		if (n == CPU_IDLE || n == CPU_IOWAIT)
			times.idle += *value;

		++n;
	}

	if (n <= CPU_IDLE)
		return std::nullopt;

	return times;
}

std::optional<CpuTimes>
FindCpuTimes(std::string_view text) noexcept
{
	for (std::string_view line : IterableSplitString(text, '\n'))
		if (auto times = ParseCpuTimes(line))
			return times;

	return std::nullopt;
}

double
CalculateBusyPercent(const CpuTimes &before, const CpuTimes &after) noexcept
{
	if (after.total <= before.total)
		return 0;

	const double total = after.total - before.total;
	const double idle = after.idle >= before.idle
		? after.idle - before.idle
		: 0;

	if (idle >= total)
		return 0;

	return 100. - idle * 100. / total;
}

std::optional<double>
ParseLoadAverage(std::string_view text) noexcept
{
	text = StripLeft(text);

	double value;
	const auto [ptr, ec] = std::from_chars(text.data(),
					       text.data() + text.size(),
					       value);
	if (ec != std::errc{} || ptr == text.data() || value < 0)
		return std::nullopt;

	return value;
}

ThrottleSignal
EvaluateThrottle(const ThrottleConfig &config,
		 double busy_percent, double load_average,
		 unsigned n_cpus) noexcept
{
	if (busy_percent > config.cpu_threshold)
		return {
			true,
			fmt::format("CPU usage {:.0f}% exceeds threshold {}%",
				    busy_percent, config.cpu_threshold),
		};

	const unsigned load_threshold = config.load_factor * n_cpus;
	if (load_average > load_threshold)
		return {
			true,
			fmt::format("Load average {:.2f} exceeds safe threshold {} ({} cores)",
				    load_average, load_threshold, n_cpus),
		};

	return {};
}

unsigned
CountUsableCpus() noexcept
{
	cpu_set_t set;
	if (sched_getaffinity(0, sizeof(set), &set) < 0)
		return 1;

	const int n = CPU_COUNT(&set);
	return n > 0 ? unsigned(n) : 1U;
}

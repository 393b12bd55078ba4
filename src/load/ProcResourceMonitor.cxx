// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ProcResourceMonitor.hxx"
#include "lib/fmt/SystemError.hxx"
#include "io/Open.hxx"
#include "io/UniqueFileDescriptor.hxx"

#include <span>
#include <stdexcept>
#include <string>
#include <thread>

/**
 * Read a small file from /proc into a string.  Throws on error.
 */
static std::string
ReadProcFile(const char *path)
{
	const auto fd = OpenReadOnly(path);

	char buffer[8192];
	const auto nbytes = fd.Read(std::as_writable_bytes(std::span{buffer}));
	if (nbytes < 0)
		throw FmtErrno("Failed to read {}", path);

	return {buffer, std::size_t(nbytes)};
}

static CpuTimes
ReadCpuTimes()
{
	const auto times = FindCpuTimes(ReadProcFile("/proc/stat"));
	if (!times)
		throw std::runtime_error{"Malformed /proc/stat"};

	return *times;
}

double
ProcResourceMonitor::SampleBusyPercent() const
{
	const auto before = ReadCpuTimes();
	std::this_thread::sleep_for(config.cpu_sample_interval);
	const auto after = ReadCpuTimes();

	return CalculateBusyPercent(before, after);
}

double
ProcResourceMonitor::ReadLoadAverage()
{
	const auto load = ParseLoadAverage(ReadProcFile("/proc/loadavg"));
	if (!load)
		throw std::runtime_error{"Malformed /proc/loadavg"};

	return *load;
}

ThrottleSignal
ProcResourceMonitor::ShouldThrottle() noexcept
try {
	const double busy = SampleBusyPercent();
	const double load = ReadLoadAverage();

	logger.Fmt(5, "cpu={:.1f}% load={:.2f} cpus={}", busy, load, n_cpus);

	return EvaluateThrottle(config, busy, load, n_cpus);
} catch (...) {
	logger(1, "Failed to measure system load, not throttling: ",
	       std::current_exception());
	return {};
}

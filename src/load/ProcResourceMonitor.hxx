// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "ResourceMonitor.hxx"
#include "io/Logger.hxx"

/**
 * A #ResourceMonitor which reads /proc/stat and /proc/loadavg.
 *
 * If a file cannot be read, the error is logged and the system is
 * assumed to be idle.
 */
class ProcResourceMonitor final : public ResourceMonitor {
	const Logger logger{"monitor"};

	const ThrottleConfig config;

	const unsigned n_cpus;

public:
	explicit ProcResourceMonitor(const ThrottleConfig &_config) noexcept
		:config(_config), n_cpus(CountUsableCpus()) {}

	/* virtual methods from ResourceMonitor */
	ThrottleSignal ShouldThrottle() noexcept override;

private:
	/**
	 * Throws on error.
	 */
	double SampleBusyPercent() const;

	/**
	 * Throws on error.
	 */
	static double ReadLoadAverage();
};

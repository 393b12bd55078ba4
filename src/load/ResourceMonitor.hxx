// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Throttle.hxx"

/**
 * Decides whether the system is too busy to start another job.
 */
class ResourceMonitor {
public:
	virtual ~ResourceMonitor() noexcept = default;

	/**
	 * Take a fresh measurement.  No state is kept between calls.
	 */
	virtual ThrottleSignal ShouldThrottle() noexcept = 0;
};

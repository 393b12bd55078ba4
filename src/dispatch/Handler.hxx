// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

struct JobOutcome;

class DispatchHandler {
public:
	/**
	 * A site's task handler has finished (or could not be
	 * started).
	 */
	virtual void OnSiteOutcome(JobOutcome &&outcome) noexcept = 0;

	/**
	 * All sites have been dispatched and no task handler is
	 * running anymore (or the dispatcher was canceled and all
	 * task handlers have exited).
	 */
	virtual void OnDispatchFinished() noexcept = 0;
};

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "util/IntrusiveList.hxx"

#include <cstddef>

struct AdmittedSite;
struct DispatchConfig;
struct JobOutcome;
class EventLoop;
class SpawnService;
class ExitListener;
class DispatchHandler;

/**
 * The set of task handlers which are currently running.
 */
class SiteWorkplace {
	EventLoop &event_loop;
	SpawnService &spawn_service;
	const DispatchConfig &config;

	/**
	 * Receives the #JobOutcome of each task handler.
	 */
	DispatchHandler &handler;

	/**
	 * Notified (with status -1) after a slot has been released.
	 */
	ExitListener &exit_listener;

	class Running;
	IntrusiveList<Running,
		IntrusiveListBaseHookTraits<Running>,
		IntrusiveListOptions{.constant_time_size = true}> running;

	const std::size_t max_operators;

public:
	SiteWorkplace(EventLoop &_event_loop,
		      SpawnService &_spawn_service,
		      const DispatchConfig &_config,
		      DispatchHandler &_handler,
		      ExitListener &_exit_listener);

	SiteWorkplace(const SiteWorkplace &other) = delete;
	SiteWorkplace &operator=(const SiteWorkplace &other) = delete;

	~SiteWorkplace() noexcept;

	bool IsEmpty() const noexcept {
		return running.empty();
	}

	bool IsFull() const noexcept {
		return running.size() >= max_operators;
	}

	std::size_t GetCount() const noexcept {
		return running.size();
	}

	/**
	 * Spawn the task handler of the given site.
	 *
	 * Throws on error.
	 */
	void Start(const AdmittedSite &site);

	/**
	 * Send SIGTERM to all task handlers (and SIGKILL after the
	 * grace period).  Each one reports a "canceled" outcome after
	 * it has exited.
	 */
	void CancelAll() noexcept;

private:
	void OnCompletion(Running &r, JobOutcome &&outcome) noexcept;
};

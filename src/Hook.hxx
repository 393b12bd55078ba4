// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "spawn/Hook.hxx"

#include <string>

/**
 * Runs inside the spawner process and checks each request before a
 * task handler is started.
 */
class RunnerSpawnHook final : public SpawnHook {
	const std::string php;

	/**
	 * Allow requests without uid (debug mode only).
	 */
	const bool allow_unset_uid;

public:
	RunnerSpawnHook(std::string_view _php, bool _allow_unset_uid) noexcept
		:php(_php), allow_unset_uid(_allow_unset_uid) {}

	/**
	 * Throws if the request is not acceptable.  Returns false
	 * so the spawner applies its own uid/gid allowlist as well.
	 */
	bool Verify(const PreparedChildProcess &p) override;
};

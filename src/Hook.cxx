// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Hook.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "spawn/Prepared.hxx"

#include <stdexcept>

bool
RunnerSpawnHook::Verify(const PreparedChildProcess &p)
{
	if (p.args.empty() || php != p.args.front())
		throw std::runtime_error{"Executable mismatch"};

	if (p.uid_gid.effective_uid == UidGid::UNSET_UID) {
		if (!allow_unset_uid)
			throw std::runtime_error{"No uid"};
	} else if (p.uid_gid.effective_uid == 0)
		throw std::runtime_error{"Refusing to run as root"};

	if (p.uid_gid.effective_gid == 0)
		throw std::runtime_error{"Refusing to run with gid 0"};

	for (const gid_t gid : p.uid_gid.supplementary_groups) {
		if (gid == UidGid::UNSET_GID)
			break;

		if (gid == 0)
			throw std::runtime_error{"Refusing to run with supplementary group 0"};
	}

	if (p.uid_gid.real_uid != UidGid::UNSET_UID ||
	    p.uid_gid.real_gid != UidGid::UNSET_GID)
		throw FmtRuntimeError("Real uid/gid not supported (uid {})",
				      p.uid_gid.effective_uid);

	return false;
}

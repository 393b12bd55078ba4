#include "Hook.hxx"
#include "spawn/Prepared.hxx"

#include <gtest/gtest.h>

static bool
Verify(SpawnHook &hook, const char *executable, uid_t uid, gid_t gid)
{
	PreparedChildProcess p;
	p.args.push_back(executable);
	p.args.push_back("/var/www/example/wp-cron.php");
	p.uid_gid.effective_uid = uid;
	p.uid_gid.effective_gid = gid;
	return hook.Verify(p);
}

TEST(Hook, Accept)
{
	RunnerSpawnHook hook{"/bin/php8.2", false};

	/* accepted, but the spawner's own allowlist applies, too */
	EXPECT_FALSE(Verify(hook, "/bin/php8.2", 1000, 1000));
}

TEST(Hook, Root)
{
	RunnerSpawnHook hook{"/bin/php8.2", false};

	EXPECT_THROW(Verify(hook, "/bin/php8.2", 0, 1000),
		     std::runtime_error);
	EXPECT_THROW(Verify(hook, "/bin/php8.2", 1000, 0),
		     std::runtime_error);
}

TEST(Hook, Executable)
{
	RunnerSpawnHook hook{"/bin/php8.2", false};

	EXPECT_THROW(Verify(hook, "/bin/sh", 1000, 1000),
		     std::runtime_error);

	PreparedChildProcess empty;
	empty.uid_gid.effective_uid = 1000;
	empty.uid_gid.effective_gid = 1000;
	EXPECT_THROW(hook.Verify(empty), std::runtime_error);
}

TEST(Hook, UnsetUid)
{
	PreparedChildProcess p;
	p.args.push_back("/bin/php8.2");

	RunnerSpawnHook strict{"/bin/php8.2", false};
	EXPECT_THROW(strict.Verify(p), std::runtime_error);

	RunnerSpawnHook debug{"/bin/php8.2", true};
	EXPECT_FALSE(debug.Verify(p));
}

TEST(Hook, SupplementaryGroupRoot)
{
	RunnerSpawnHook hook{"/bin/php8.2", false};

	PreparedChildProcess p;
	p.args.push_back("/bin/php8.2");
	p.uid_gid.effective_uid = 1000;
	p.uid_gid.effective_gid = 1000;
	p.uid_gid.supplementary_groups[0] = 1000;
	p.uid_gid.supplementary_groups[1] = 33;
	p.uid_gid.supplementary_groups[2] = UidGid::UNSET_GID;
	EXPECT_FALSE(hook.Verify(p));

	p.uid_gid.supplementary_groups[1] = 0;
	EXPECT_THROW(hook.Verify(p), std::runtime_error);
}

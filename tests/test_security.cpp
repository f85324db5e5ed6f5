// Security.h comes first so it must compile on its own.
#include "Security.h"
#include <gtest/gtest.h>

TEST(SecurityTest, TmpfsMountTakesTargetByValue) {
    std::string target = "/run";
    Security::TmpfsMount mount(target, 16);
    EXPECT_EQ(mount.target, "/run");
    EXPECT_EQ(target, "/run");
    EXPECT_EQ(Security::tmpfs_spec(mount), "/run:rw,noexec,nosuid,size=16m");
}

TEST(SecurityTest, TmpfsSpecOmitsDisabledOptions) {
    Security::TmpfsMount mount("/var/cache", 0);
    mount.noexec = false;
    EXPECT_EQ(Security::tmpfs_spec(mount), "/var/cache:rw,nosuid");
}

TEST(SecurityTest, PermissivePolicyRendersOnlyTmpfs) {
    Security::SecurityConfig policy;
    policy.no_new_privileges = false;
    policy.drop_capabilities = false;
    policy.readonly_rootfs = false;
    std::vector<std::string> flags = Security::runtime_flags(policy);
    ASSERT_EQ(flags.size(), 2u);
    EXPECT_EQ(flags[0], "--tmpfs");
    EXPECT_EQ(flags[1], "/tmp:rw,noexec,nosuid,size=50m");
}

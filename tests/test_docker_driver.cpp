#include <gtest/gtest.h>
#include <algorithm>
#include "DockerDriver.h"
#include "LabCatalog.h"
#include "Logger.h"
#include "TestUtil.h"

static bool has(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

TEST(SecurityFlagsTest, DefaultPolicyLocksDownContainer) {
    Security::SecurityConfig policy;
    std::vector<std::string> flags = Security::runtime_flags(policy);
    EXPECT_EQ(flags, (std::vector<std::string>{
        "--security-opt=no-new-privileges",
        "--cap-drop=ALL",
        "--cap-add=NET_BIND_SERVICE",
        "--read-only",
        "--tmpfs", "/tmp:rw,noexec,nosuid,size=50m",
    }));
}

TEST(SecurityFlagsTest, ConfiguredMountsReplaceDefaultTmp) {
    Security::SecurityConfig policy;
    policy.tmpfs_mounts = {Security::TmpfsMount("/var/lib/mysql", 100)};
    policy.tmpfs_mounts[0].noexec = false;
    std::vector<std::string> flags = Security::runtime_flags(policy);
    EXPECT_TRUE(has(flags, "/var/lib/mysql:rw,nosuid,size=100m"));
    EXPECT_FALSE(has(flags, "/tmp:rw,noexec,nosuid,size=50m"));
}

TEST(SecurityFlagsTest, CapabilityNames) {
    EXPECT_EQ(Security::capability_name(Security::Capability::CAP_NET_BIND_SERVICE), "NET_BIND_SERVICE");
    EXPECT_EQ(Security::capability_from_name("cap_chown"), Security::Capability::CAP_CHOWN);
    EXPECT_EQ(Security::capability_from_name("SETUID"), Security::Capability::CAP_SETUID);
    EXPECT_FALSE(Security::capability_from_name("SYS_ADMIN").has_value());
}

TEST(DockerDriverTest, RunArgumentsCarryLimitsLabelsAndPolicy) {
    testutil::TempDir dir;
    Logger logger(dir.path() + "/logs");
    Config config = default_config();
    DockerDriver driver(config, logger);

    LabCatalog catalog(config.labs);
    auto dvwa = catalog.find("dvwa");
    ASSERT_TRUE(dvwa.has_value());

    LaunchRequest req;
    req.name = "dvwa-alice-0042";
    req.image = dvwa->image;
    req.network = "ctf-isolated";
    req.resources = dvwa->resources;
    req.security = dvwa->security;
    req.labels = {{"ctf-owner", "alice"}, {"ctf-lab-type", "dvwa"}, {"ctf-managed", "true"}};

    std::vector<std::string> args = driver.build_run_args(req);
    ASSERT_GE(args.size(), 12u);
    EXPECT_EQ(args[0], "run");
    EXPECT_EQ(args[1], "-d");
    EXPECT_EQ(args[2], "--name");
    EXPECT_EQ(args[3], "dvwa-alice-0042");
    EXPECT_EQ(args[4], "--network");
    EXPECT_EQ(args[5], "ctf-isolated");
    EXPECT_TRUE(has(args, "--memory=2g"));
    EXPECT_TRUE(has(args, "--cpus=1"));
    EXPECT_TRUE(has(args, "--pids-limit=100"));
    EXPECT_TRUE(has(args, "--label=ctf-owner=alice"));
    EXPECT_TRUE(has(args, "--label=ctf-lab-type=dvwa"));
    EXPECT_TRUE(has(args, "--cap-drop=ALL"));
    EXPECT_TRUE(has(args, "--read-only"));
    EXPECT_TRUE(has(args, "/var/run/mysqld:rw,noexec,nosuid,size=10m"));
    EXPECT_EQ(args.back(), "vulnerables/web-dvwa");
}

TEST(DockerDriverTest, MissingBinaryIsAFailureNotAHang) {
    testutil::TempDir dir;
    Logger logger(dir.path() + "/logs");
    Config config = default_config();
    config.runtime_binary = "labctl-no-such-runtime";
    DockerDriver driver(config, logger);

    EXPECT_FALSE(driver.exists("anything"));
    EXPECT_FALSE(driver.inspect_running("anything"));
    EXPECT_FALSE(driver.inspect_address("anything").has_value());
    EXPECT_FALSE(driver.remove("anything").ok());
    EXPECT_FALSE(driver.network_exists("ctf-isolated"));
}

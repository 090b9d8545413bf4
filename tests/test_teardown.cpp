#include <gtest/gtest.h>

#include "deploy/teardown.hpp"
#include "testing.hpp"

namespace mdeploy {

namespace fs = std::filesystem;

class TeardownTest : public ::testing::Test {
  protected:
    TeardownTest()
        : ops_(std::make_shared<testutil::FakeIdentityOps>()),
          layout_{.root = dir_ / "opt/motion-frontend", .host_log_dir = dir_ / "var/log/motion-frontend"},
          identity_({.user = "motion-frontend", .group = "motion-frontend", .home = layout_.root.string()}, ops_),
          releaser_(registry_, PortReleaser::Policy{}, testutil::NoSleep),
          units_(services_, releaser_,
                 UnitParams{.service_name = "motion-frontend",
                            .root = layout_.root.string(),
                            .user = "motion-frontend",
                            .group = "motion-frontend",
                            .repo_owner = "sn8k",
                            .repo_name = "Mme"},
                 UnitManager::Options{.unit_dir = dir_ / "etc/systemd/system", .ports = {8765}},
                 testutil::NoSleep),
          relay_(http_, services_,
                 MediaRelay::Paths{.binary = dir_ / "usr/local/bin/mediamtx",
                                   .config = dir_ / "etc/mediamtx.yml",
                                   .unit_dir = dir_ / "etc/systemd/system",
                                   .scratch_base = dir_ / "tmp"}) {}

    void SetUp() override {
        ASSERT_TRUE(identity_.EnsureIdentity().is_ok());
        testutil::WriteFile(layout_.root / "backend/server.py", "print('serve')\n");
        testutil::WriteFile(layout_.RuntimeConfigFile(), "{\"meeting\": {\"device_key\": \"KEY\"}}\n");
        testutil::WriteFile(layout_.host_log_dir / "motion-frontend.log", "started\n");
        ASSERT_TRUE(units_.Install().is_ok());
        ASSERT_TRUE(units_.StartAndWait().is_ok());
    }

    TeardownManager Manager() {
        return TeardownManager(layout_, units_, identity_, &relay_, decisions_,
                               TeardownManager::Options{.backup_dir = dir_ / "var/backups"});
    }

    testutil::TemporaryDirectory dir_;
    std::shared_ptr<testutil::FakeIdentityOps> ops_;
    InstallationLayout layout_;
    IdentityProvisioner identity_;
    testutil::FakeServiceManager services_;
    testutil::FakePortRegistry registry_;
    testutil::FakeHttpClient http_;
    PortReleaser releaser_;
    UnitManager units_;
    MediaRelay relay_;
    testutil::ScriptedDecisionSource decisions_;
};

TEST_F(TeardownTest, RemovingEverythingLeavesNoTrace) {
    decisions_.confirms = {true, true, true};

    TeardownManager::Outcome out;
    ASSERT_TRUE(Manager().Run(&out).is_ok());

    EXPECT_TRUE(out.unit_removed);
    EXPECT_TRUE(out.root_removed);
    EXPECT_TRUE(out.host_logs_removed);
    EXPECT_FALSE(out.config_backup.has_value());
    EXPECT_TRUE(out.user_removed);
    EXPECT_TRUE(out.group_removed);

    EXPECT_FALSE(fs::exists(layout_.root));
    EXPECT_FALSE(fs::exists(layout_.host_log_dir));
    EXPECT_FALSE(units_.UnitPresent());
    EXPECT_FALSE(fs::exists(dir_ / "var/backups"));
    EXPECT_FALSE(services_.units["motion-frontend"].active);
    EXPECT_FALSE(ops_->UserExists("motion-frontend"));
}

TEST_F(TeardownTest, DefaultsKeepConfigurationAndAccount) {
    TeardownManager::Outcome out;
    ASSERT_TRUE(Manager().Run(&out).is_ok());

    ASSERT_TRUE(out.config_backup.has_value());
    EXPECT_EQ(out.config_backup->parent_path(), dir_ / "var/backups");
    EXPECT_EQ(out.config_backup->filename().string().rfind("motion-frontend-config-backup-", 0), 0u);
    EXPECT_EQ(testutil::ReadFile(*out.config_backup / "motion_frontend.json"),
              "{\"meeting\": {\"device_key\": \"KEY\"}}\n");

    EXPECT_FALSE(fs::exists(layout_.root));
    EXPECT_FALSE(out.user_removed);
    EXPECT_FALSE(out.group_removed);
    EXPECT_TRUE(ops_->UserExists("motion-frontend"));
    EXPECT_TRUE(decisions_.Asked("Remove the system user 'motion-frontend'?"));
}

TEST_F(TeardownTest, DeclinedConfirmationChangesNothing) {
    decisions_.action_confirmed = false;

    auto r = Manager().Run();
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Aborted);
    EXPECT_TRUE(fs::exists(layout_.RuntimeConfigFile()));
    EXPECT_TRUE(units_.UnitPresent());
    EXPECT_TRUE(services_.units["motion-frontend"].active);
}

TEST_F(TeardownTest, RelayIsOfferedOnlyWhenPresent) {
    ASSERT_TRUE(Manager().Run().is_ok());
    EXPECT_FALSE(decisions_.Asked("MediaMTX"));
}

TEST_F(TeardownTest, RelayRemovalDeletesItsFiles) {
    testutil::WriteFile(dir_ / "usr/local/bin/mediamtx", "ELF");
    testutil::WriteFile(dir_ / "etc/mediamtx.yml", "paths: {}\n");
    testutil::WriteFile(dir_ / "etc/systemd/system/mediamtx.service", "[Unit]\n");
    // config removed, keep user and group, remove relay
    decisions_.confirms = {true, false, false, true};

    TeardownManager::Outcome out;
    ASSERT_TRUE(Manager().Run(&out).is_ok());
    EXPECT_TRUE(out.relay_removed);
    EXPECT_FALSE(fs::exists(dir_ / "usr/local/bin/mediamtx"));
    EXPECT_FALSE(fs::exists(dir_ / "etc/mediamtx.yml"));
    EXPECT_FALSE(fs::exists(dir_ / "etc/systemd/system/mediamtx.service"));
}

TEST_F(TeardownTest, SecondRunIsHarmless) {
    decisions_.confirms = {true, true, true};
    ASSERT_TRUE(Manager().Run().is_ok());

    TeardownManager::Outcome out;
    ASSERT_TRUE(Manager().Run(&out).is_ok());
    EXPECT_FALSE(out.unit_removed);
    EXPECT_FALSE(out.root_removed);
    EXPECT_FALSE(out.config_backup.has_value());
}

} // namespace mdeploy

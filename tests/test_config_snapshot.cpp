#include <gtest/gtest.h>

#include "deploy/config_snapshot.hpp"
#include "testing.hpp"

namespace mdeploy {

namespace fs = std::filesystem;

class ConfigSnapshotTest : public ::testing::Test {
  protected:
    void SetUp() override {
        testutil::WriteFile(config_dir_ / "motion_frontend.json", "{\"theme\": \"dark\"}\n");
        testutil::WriteFile(config_dir_ / "cameras/cam1.json", "{\"name\": \"porch\"}\n");
    }

    testutil::TemporaryDirectory dir_;
    fs::path config_dir_ = dir_ / "opt/motion-frontend/config";
    fs::path backups_ = dir_ / "backups";
};

TEST_F(ConfigSnapshotTest, CaptureCopiesTreeWithManifest) {
    auto snap = ConfigSnapshot::Capture(config_dir_, backups_, "motion-frontend");
    ASSERT_TRUE(snap.has_value()) << snap.error();

    EXPECT_EQ(snap->Dir().parent_path(), backups_);
    EXPECT_EQ(snap->Dir().filename().string().rfind("motion-frontend-config-backup-", 0), 0u);
    EXPECT_EQ(snap->FileCount(), 2u);
    EXPECT_EQ(testutil::ReadFile(snap->Dir() / "cameras/cam1.json"), "{\"name\": \"porch\"}\n");
    EXPECT_TRUE(fs::exists(snap->Dir() / kSnapshotManifestName));
    EXPECT_EQ(testutil::ModeOf(snap->Dir()), 0700u);
    EXPECT_TRUE(snap->Verify().is_ok());
}

TEST_F(ConfigSnapshotTest, SameSecondCapturesDoNotCollide) {
    auto first = ConfigSnapshot::Capture(config_dir_, backups_, "motion-frontend");
    auto second = ConfigSnapshot::Capture(config_dir_, backups_, "motion-frontend");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(first->Dir(), second->Dir());
}

TEST_F(ConfigSnapshotTest, RestoreOverwritesAndVerifies) {
    auto snap = ConfigSnapshot::Capture(config_dir_, backups_, "motion-frontend");
    ASSERT_TRUE(snap.has_value());

    fs::remove_all(config_dir_);
    testutil::WriteFile(config_dir_ / "motion_frontend.json", "{\"from_archive\": true}\n");

    ASSERT_TRUE(snap->RestoreTo(config_dir_).is_ok());
    EXPECT_EQ(testutil::ReadFile(config_dir_ / "motion_frontend.json"), "{\"theme\": \"dark\"}\n");
    EXPECT_EQ(testutil::ReadFile(config_dir_ / "cameras/cam1.json"), "{\"name\": \"porch\"}\n");
    EXPECT_FALSE(fs::exists(config_dir_ / kSnapshotManifestName));
}

TEST_F(ConfigSnapshotTest, TamperedSnapshotIsNotRestored) {
    auto snap = ConfigSnapshot::Capture(config_dir_, backups_, "motion-frontend");
    ASSERT_TRUE(snap.has_value());
    testutil::WriteFile(snap->Dir() / "motion_frontend.json", "{}\n");
    testutil::WriteFile(config_dir_ / "motion_frontend.json", "{\"current\": 1}\n");

    EXPECT_FALSE(snap->Verify().is_ok());
    EXPECT_FALSE(snap->RestoreTo(config_dir_).is_ok());
    EXPECT_EQ(testutil::ReadFile(config_dir_ / "motion_frontend.json"), "{\"current\": 1}\n");
}

TEST_F(ConfigSnapshotTest, OpenReadsManifestBack) {
    auto snap = ConfigSnapshot::Capture(config_dir_, backups_, "motion-frontend");
    ASSERT_TRUE(snap.has_value());

    auto reopened = ConfigSnapshot::Open(snap->Dir());
    ASSERT_TRUE(reopened.has_value()) << reopened.error();
    EXPECT_EQ(reopened->FileCount(), 2u);
    EXPECT_TRUE(reopened->Verify().is_ok());

    EXPECT_FALSE(ConfigSnapshot::Open(dir_ / "nowhere").has_value());
}

TEST_F(ConfigSnapshotTest, ConsumeRemovesDirectory) {
    auto snap = ConfigSnapshot::Capture(config_dir_, backups_, "motion-frontend");
    ASSERT_TRUE(snap.has_value());
    const auto where = snap->Dir();

    ASSERT_TRUE(snap->Consume().is_ok());
    EXPECT_TRUE(snap->Consumed());
    EXPECT_FALSE(fs::exists(where));
    EXPECT_TRUE(snap->Consume().is_ok());
    EXPECT_FALSE(snap->Verify().is_ok());
}

TEST_F(ConfigSnapshotTest, MissingConfigDirectoryFails) {
    fs::remove_all(config_dir_);
    auto snap = ConfigSnapshot::Capture(config_dir_, backups_, "motion-frontend");
    ASSERT_FALSE(snap.has_value());
    EXPECT_NE(snap.error().find("not found"), std::string::npos);
}

} // namespace mdeploy

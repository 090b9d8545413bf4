#include <gtest/gtest.h>

#include "util/path_utils.hpp"

TEST(PathUtilsTest, NormalizeArchivePathCleansInput) {
    EXPECT_EQ(mdeploy::NormalizeArchivePath("./requirements.txt"), "requirements.txt");
    EXPECT_EQ(mdeploy::NormalizeArchivePath("/Mme-main//backend///app"), "Mme-main/backend/app");
    EXPECT_EQ(mdeploy::NormalizeArchivePath("////././a//b"), "././a/b");
    EXPECT_EQ(mdeploy::NormalizeArchivePath(""), "");
}

TEST(PathUtilsTest, FirstComponent) {
    EXPECT_EQ(mdeploy::FirstComponent("Mme-main/backend/server.py"), "Mme-main");
    EXPECT_EQ(mdeploy::FirstComponent("Mme-main/"), "Mme-main");
    EXPECT_EQ(mdeploy::FirstComponent("file"), "file");
}

TEST(PathUtilsTest, SafeRemovalTargetNeedsTwoLevels) {
    EXPECT_TRUE(mdeploy::IsSafeRemovalTarget("/opt/motion-frontend"));
    EXPECT_TRUE(mdeploy::IsSafeRemovalTarget("/var/log/motion-frontend/"));
    EXPECT_FALSE(mdeploy::IsSafeRemovalTarget("/"));
    EXPECT_FALSE(mdeploy::IsSafeRemovalTarget("/opt"));
    EXPECT_FALSE(mdeploy::IsSafeRemovalTarget("/opt/.."));
    EXPECT_FALSE(mdeploy::IsSafeRemovalTarget("opt/motion-frontend"));
}

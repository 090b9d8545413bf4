#include <gtest/gtest.h>

#include "deploy/archive_extractor.hpp"
#include "testing.hpp"

#include <filesystem>

namespace mdeploy {

namespace fs = std::filesystem;

class ArchiveExtractorTest : public ::testing::Test {
protected:
    testutil::TemporaryDirectory temp_dir;

    Result Extract(const std::string& tar, ExtractStats* stats = nullptr) {
        testutil::MemorySource reader(tar);
        return ArchiveExtractor{}.ExtractToDir(reader, temp_dir.Path(), "test", stats);
    }
};

TEST_F(ArchiveExtractorTest, ExtractsGzipTarballAndReportsTopLevel) {
    ExtractStats stats;
    auto res = Extract(testutil::BuildReleaseTarball("Mme-dev"), &stats);
    ASSERT_TRUE(res.is_ok()) << res.msg;

    EXPECT_EQ(testutil::ReadFile(temp_dir / "Mme-dev/backend/server.py"), "print('serve')\n");
    EXPECT_TRUE(fs::is_directory(temp_dir / "Mme-dev/templates"));
    ASSERT_EQ(stats.top_level.size(), 1u);
    EXPECT_EQ(*stats.top_level.begin(), "Mme-dev");
    EXPECT_GE(stats.entries, 6u);
}

TEST_F(ArchiveExtractorTest, RejectsTraversalBeforeWriting) {
    auto tar = testutil::BuildTar({{"top/ok.txt", "fine"}, {"top/../../evil.txt", "bad"}});
    auto res = Extract(tar);
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("Unsafe path"), std::string::npos);
    EXPECT_FALSE(fs::exists(fs::path(temp_dir.Path()).parent_path() / "evil.txt"));
}

TEST_F(ArchiveExtractorTest, RejectsEscapingSymlink) {
    testutil::TarEntry link{"top/link", "", AE_IFLNK, "../../../etc"};
    auto res = Extract(testutil::BuildTar({link}));
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("Unsafe symlink"), std::string::npos);
}

TEST_F(ArchiveExtractorTest, FailsOnGarbage) {
    auto res = Extract("this is not an archive at all");
    EXPECT_FALSE(res.is_ok());
}

TEST_F(ArchiveExtractorTest, FailsWhenDestinationMissing) {
    testutil::MemorySource reader(testutil::BuildReleaseTarball());
    auto res = ArchiveExtractor{}.ExtractToDir(reader, temp_dir.Path() + "/missing", "test");
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("not a directory"), std::string::npos);
}

} // namespace mdeploy

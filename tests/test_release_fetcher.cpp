#include <gtest/gtest.h>

#include "deploy/release_fetcher.hpp"
#include "testing.hpp"

#include <filesystem>

namespace mdeploy {

namespace fs = std::filesystem;

class ReleaseFetcherTest : public ::testing::Test {
protected:
    testutil::TemporaryDirectory tmp;
    testutil::FakeHttpClient http;
    testutil::ScriptedDecisionSource decisions;

    ReleaseFetcher MakeFetcher() {
        fs::create_directories(tmp / "scratch");
        return ReleaseFetcher(http, decisions,
                              ReleaseFetcher::Options{.owner = "sn8k",
                                                      .repo = "Mme",
                                                      .default_branch = "main",
                                                      .scratch_base = tmp / "scratch"});
    }

    InstallationLayout Layout() const {
        return InstallationLayout{.root = tmp / "opt/motion-frontend", .host_log_dir = tmp / "log"};
    }
};

TEST_F(ReleaseFetcherTest, Urls) {
    auto f = MakeFetcher();
    EXPECT_EQ(f.BranchesUrl(), "https://api.github.com/repos/sn8k/Mme/branches");
    EXPECT_EQ(f.ArchiveUrl("v1.2"), "https://github.com/sn8k/Mme/archive/v1.2.tar.gz");
}

TEST_F(ReleaseFetcherTest, SelectBranchFallsBackWhenListingUnreachable) {
    auto f = MakeFetcher();
    EXPECT_EQ(f.SelectBranch(), "main");
    EXPECT_TRUE(decisions.questions.empty());
}

TEST_F(ReleaseFetcherTest, SelectBranchFallsBackOnHttpError) {
    auto f = MakeFetcher();
    http.Respond(HttpMethod::Get, f.BranchesUrl(), 403, "{\"message\": \"rate limited\"}");
    EXPECT_EQ(f.SelectBranch(), "main");
}

TEST_F(ReleaseFetcherTest, SelectBranchOffersListWithDefault) {
    auto f = MakeFetcher();
    http.Respond(HttpMethod::Get, f.BranchesUrl(), 200,
                 R"([{"name": "dev"}, {"name": "main"}, {"name": "feature/x"}])");

    decisions.choice = 2;
    EXPECT_EQ(f.SelectBranch(), "feature/x");
    EXPECT_EQ(decisions.offered, (std::vector<std::string>{"dev", "main", "feature/x"}));

    decisions.choice.reset();
    EXPECT_EQ(f.SelectBranch(), "main");

    decisions.invalid_choice = true;
    EXPECT_EQ(f.SelectBranch(), "main");
}

TEST_F(ReleaseFetcherTest, FetchCopiesSnapshotIntoRoot) {
    auto f = MakeFetcher();
    http.ServeFile(f.ArchiveUrl("main"), testutil::BuildReleaseTarball("Mme-main"));

    ReleaseInfo info;
    auto res = f.Fetch("main", Layout(), false, info);
    ASSERT_TRUE(res.is_ok()) << res.msg;

    EXPECT_EQ(testutil::ReadFile(Layout().root / "backend/server.py"), "print('serve')\n");
    EXPECT_TRUE(fs::exists(Layout().Requirements()));
    EXPECT_EQ(info.branch, "main");
    EXPECT_EQ(info.archive_sha256.size(), 64u);
    EXPECT_FALSE(info.installed_at.empty());

    // Scratch space is gone once the fetch returns.
    EXPECT_TRUE(fs::is_empty(tmp / "scratch"));
}

TEST_F(ReleaseFetcherTest, FetchWithPreservedConfigLeavesConfigUntouched) {
    auto f = MakeFetcher();
    http.ServeFile(f.ArchiveUrl("main"), testutil::BuildReleaseTarball("Mme-main", true));
    testutil::WriteFile(Layout().RuntimeConfigFile(), "{\"mine\": 1}");

    ReleaseInfo info;
    ASSERT_TRUE(f.Fetch("main", Layout(), true, info).is_ok());
    EXPECT_EQ(testutil::ReadFile(Layout().RuntimeConfigFile()), "{\"mine\": 1}");

    ASSERT_TRUE(f.Fetch("main", Layout(), false, info).is_ok());
    EXPECT_EQ(testutil::ReadFile(Layout().RuntimeConfigFile()), "{\"from_archive\": true}\n");
}

TEST_F(ReleaseFetcherTest, FetchRejectsSnapshotWithoutCode) {
    auto f = MakeFetcher();
    http.ServeFile(f.ArchiveUrl("docs"), testutil::BuildTar({{"Mme-docs/README.md", "# docs"}}, true));

    ReleaseInfo info;
    auto res = f.Fetch("docs", Layout(), false, info);
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("backend"), std::string::npos);
    EXPECT_FALSE(fs::exists(Layout().root));
}

TEST_F(ReleaseFetcherTest, FetchRejectsSeveralTopLevelEntries) {
    auto f = MakeFetcher();
    http.ServeFile(f.ArchiveUrl("main"),
                   testutil::BuildTar({{"a/backend/x", "1"}, {"b/backend/y", "2"}}, true));

    ReleaseInfo info;
    auto res = f.Fetch("main", Layout(), false, info);
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("single top-level"), std::string::npos);
}

TEST_F(ReleaseFetcherTest, FetchReportsMissingRef) {
    auto f = MakeFetcher();
    ReleaseInfo info;
    auto res = f.Fetch("nope", Layout(), false, info);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::Fatal);
    EXPECT_NE(res.hint.find("nope"), std::string::npos);
}

TEST(ReleaseMarkerTest, WriteThenRead) {
    testutil::TemporaryDirectory tmp;
    const auto path = tmp / ".deploy-release.json";
    ReleaseInfo in{.branch = "dev", .archive_sha256 = std::string(64, 'a'), .installed_at = "2026-01-01T00:00:00Z"};
    ASSERT_TRUE(WriteReleaseMarker(path, in).is_ok());

    auto out = ReadReleaseMarker(path);
    ASSERT_TRUE(out.has_value()) << out.error();
    EXPECT_EQ(out->branch, "dev");
    EXPECT_EQ(out->archive_sha256, in.archive_sha256);
    EXPECT_EQ(testutil::ModeOf(path), 0644u);

    EXPECT_FALSE(ReadReleaseMarker(tmp / "absent.json").has_value());
}

TEST(BranchListingTest, ParsesNames) {
    auto names = ParseBranchNames(R"([{"name":"main","commit":{}},{"name":""},{"x":1},{"name":"dev"}])");
    ASSERT_TRUE(names.has_value());
    EXPECT_EQ(*names, (std::vector<std::string>{"main", "dev"}));
    EXPECT_FALSE(ParseBranchNames("{\"message\":\"Not Found\"}").has_value());
    EXPECT_FALSE(ParseBranchNames("not json").has_value());
}

} // namespace mdeploy

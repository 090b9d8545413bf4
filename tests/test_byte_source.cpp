#include <gtest/gtest.h>

#include "io/atomic_file.hpp"
#include "io/byte_source.hpp"
#include "io/fd.hpp"
#include "testing.hpp"

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace {

using mdeploy::Fd;
using mdeploy::FileSource;

TEST(FdTests, ClosesOnDestructionAndKeepsReleasedDescriptors) {
    auto opened = Fd::Open("/dev/null", O_RDONLY);
    ASSERT_TRUE(opened.has_value());
    const int closed_fd = opened->Get();
    { Fd holder = std::move(*opened); }
    errno = 0;
    EXPECT_EQ(::close(closed_fd), -1);
    EXPECT_EQ(errno, EBADF);

    auto again = Fd::Open("/dev/null", O_RDONLY);
    ASSERT_TRUE(again.has_value());
    const int raw = again->Release();
    EXPECT_FALSE(again->Valid());
    EXPECT_EQ(::fcntl(raw, F_GETFD) & FD_CLOEXEC, FD_CLOEXEC);
    EXPECT_EQ(::close(raw), 0);
}

TEST(FdTests, OpenReportsErrno) {
    auto opened = Fd::Open("/nonexistent/motion-deploy", O_RDONLY);
    ASSERT_FALSE(opened.has_value());
    EXPECT_EQ(opened.error(), ENOENT);
}

class FileSourceTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
};

TEST_F(FileSourceTests, DrainsLargeFileAndReportsSize) {
    std::string data(300 * 1024 + 7, '\0');
    for (size_t i = 0; i < data.size(); ++i) data[i] = static_cast<char>((i * 13) & 0xFF);
    const std::string path = tmp.Path() + "/release.tar.gz";
    ASSERT_TRUE(mdeploy::WriteFileAtomic(path, data, 0644).is_ok());

    FileSource src;
    auto r = FileSource::Open(path, src);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    ASSERT_TRUE(src.SizeHint().has_value());
    EXPECT_EQ(*src.SizeHint(), data.size());
    EXPECT_EQ(src.Describe(), path);

    std::string out;
    ASSERT_TRUE(mdeploy::DrainToString(src, out).is_ok());
    EXPECT_EQ(out, data);
}

TEST_F(FileSourceTests, DrainStopsAtLimit) {
    const std::string path = tmp.Path() + "/motion_frontend.json";
    ASSERT_TRUE(mdeploy::WriteFileAtomic(path, std::string(4096, 'x'), 0640).is_ok());

    FileSource src;
    ASSERT_TRUE(FileSource::Open(path, src).is_ok());
    std::string out;
    auto r = mdeploy::DrainToString(src, out, 1024);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.err, EFBIG);
    EXPECT_NE(r.msg.find(path), std::string::npos);
}

TEST_F(FileSourceTests, RejectsMissingFilesAndDirectories) {
    FileSource src;
    auto missing = FileSource::Open(tmp.Path() + "/absent", src);
    ASSERT_FALSE(missing.is_ok());
    EXPECT_EQ(missing.err, ENOENT);

    auto dir = FileSource::Open(tmp.Path(), src);
    ASSERT_FALSE(dir.is_ok());
    EXPECT_EQ(dir.err, EISDIR);
}

TEST_F(FileSourceTests, ReadFileToStringReplacesContents) {
    const std::string path = tmp.Path() + "/requirements.txt";
    ASSERT_TRUE(mdeploy::WriteFileAtomic(path, "aiohttp\njinja2\n", 0644).is_ok());
    std::string out = "stale";
    ASSERT_TRUE(mdeploy::ReadFileToString(path, out).is_ok());
    EXPECT_EQ(out, "aiohttp\njinja2\n");
    EXPECT_EQ(testutil::ModeOf(path), 0644u);
}

} // namespace

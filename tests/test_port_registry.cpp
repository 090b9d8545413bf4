#include <gtest/gtest.h>

#include "system/port_registry.hpp"
#include "testing.hpp"

#include <csignal>
#include <unistd.h>

namespace mdeploy {

namespace {

// Two listeners on 8765 (v4 inode 1111, one ESTABLISHED on the same port),
// one listener on 8081.
constexpr const char* kTcpTable =
    "  sl  local_address rem_address   st tx_queue rx_queue tr tm->when retrnsmt   uid  timeout inode\n"
    "   0: 00000000:223D 00000000:0000 0A 00000000:00000000 00:00000000 00000000   999        0 1111 1 0000\n"
    "   1: 0100007F:223D 0100007F:C350 01 00000000:00000000 00:00000000 00000000   999        0 2222 1 0000\n"
    "   2: 00000000:1F91 00000000:0000 0A 00000000:00000000 00:00000000 00000000     0        0 3333 1 0000\n";

std::vector<std::chrono::milliseconds> g_sleeps;

void RecordSleep(std::chrono::milliseconds d) { g_sleeps.push_back(d); }

} // namespace

TEST(PortTableTest, OnlyListeningSocketsOnThePort) {
    EXPECT_EQ(ParseListeningInodes(kTcpTable, 8765), (std::vector<unsigned long>{1111}));
    EXPECT_EQ(ParseListeningInodes(kTcpTable, 8081), (std::vector<unsigned long>{3333}));
    EXPECT_TRUE(ParseListeningInodes(kTcpTable, 8090).empty());
    EXPECT_TRUE(ParseListeningInodes("", 8765).empty());
}

TEST(ProcPortRegistryTest, MapsSocketInodesToProcesses) {
    testutil::TemporaryDirectory proc;
    testutil::WriteFile(proc / "net/tcp", kTcpTable);
    testutil::WriteFile(proc / "net/tcp6", "  sl  local_address\n");
    std::filesystem::create_directories(proc / "4242/fd");
    std::filesystem::create_symlink("socket:[1111]", proc / "4242/fd/7");
    std::filesystem::create_directories(proc / "5000/fd");
    std::filesystem::create_symlink("socket:[9999]", proc / "5000/fd/3");
    std::filesystem::create_directories(proc / "self");

    ProcPortRegistry registry(proc.Path());
    EXPECT_EQ(registry.ListOwners(8765), (std::vector<int>{4242}));
    EXPECT_TRUE(registry.ListOwners(8090).empty());
}

TEST(PortReleaserTest, GracefulTerminationIsEnough) {
    testutil::FakePortRegistry registry;
    registry.owners[8765] = {4242};
    g_sleeps.clear();

    PortReleaser releaser(registry, PortReleaser::Policy{}, RecordSleep);
    ASSERT_TRUE(releaser.FreePorts({8765, 8081}).is_ok());

    ASSERT_EQ(registry.signals.size(), 1u);
    EXPECT_EQ(registry.signals[0], std::make_pair(4242, SIGTERM));
    EXPECT_EQ(releaser.TerminatedCount(), 1);
    // Settle once after terminating something.
    ASSERT_FALSE(g_sleeps.empty());
    EXPECT_EQ(g_sleeps.back(), PortReleaser::Policy{}.settle);
}

TEST(PortReleaserTest, StubbornHolderIsKilledAfterBackoff) {
    testutil::FakePortRegistry registry;
    registry.owners[8765] = {4242};
    registry.stubborn = {4242};
    g_sleeps.clear();

    PortReleaser::Policy policy;
    policy.max_attempts = 4;
    PortReleaser releaser(registry, policy, RecordSleep);
    ASSERT_TRUE(releaser.FreePorts({8765}).is_ok());

    ASSERT_EQ(registry.signals.size(), 2u);
    EXPECT_EQ(registry.signals[0].second, SIGTERM);
    EXPECT_EQ(registry.signals[1].second, SIGKILL);

    // Exponential backoff while waiting for SIGTERM to take effect.
    ASSERT_GE(g_sleeps.size(), 4u);
    EXPECT_EQ(g_sleeps[0], std::chrono::milliseconds{100});
    EXPECT_EQ(g_sleeps[1], std::chrono::milliseconds{200});
    EXPECT_EQ(g_sleeps[2], std::chrono::milliseconds{400});
    EXPECT_EQ(g_sleeps[3], std::chrono::milliseconds{800});
}

TEST(PortReleaserTest, FreePortsIsNoOpWithoutHolders) {
    testutil::FakePortRegistry registry;
    g_sleeps.clear();
    PortReleaser releaser(registry, PortReleaser::Policy{}, RecordSleep);
    ASSERT_TRUE(releaser.FreePorts({8765, 8081, 8082}).is_ok());
    EXPECT_TRUE(registry.signals.empty());
    EXPECT_TRUE(g_sleeps.empty());
}

TEST(PortReleaserTest, OwnProcessIsNeverSignalled) {
    testutil::FakePortRegistry registry;
    registry.owners[8765] = {static_cast<int>(::getpid())};
    PortReleaser releaser(registry, PortReleaser::Policy{}, testutil::NoSleep);
    EXPECT_TRUE(releaser.FreePorts({8765}).is_ok());
    EXPECT_TRUE(registry.signals.empty());
}

TEST(PortReleaserTest, SharedPortIsReleasedOnceOtherHoldersExit) {
    testutil::FakePortRegistry registry;
    const int self = static_cast<int>(::getpid());
    registry.owners[8765] = {self, 4242};
    g_sleeps.clear();
    PortReleaser releaser(registry, PortReleaser::Policy{.max_attempts = 4}, RecordSleep);

    ASSERT_TRUE(releaser.FreePorts({8765}).is_ok());
    ASSERT_EQ(registry.signals.size(), 1u);
    EXPECT_EQ(registry.signals[0], std::make_pair(4242, SIGTERM));
    // Only the settle delay, no backoff while this process still listens.
    ASSERT_EQ(g_sleeps.size(), 1u);
    EXPECT_EQ(g_sleeps[0], PortReleaser::Policy{}.settle);
}

} // namespace mdeploy

#include <gtest/gtest.h>

#include "system/decision_source.hpp"

#include <sstream>

namespace mdeploy {

TEST(TerminalDecisionSourceTest, ConfirmHonoursAnswerAndDefault) {
    std::istringstream in("y\n\nno\n\n");
    std::ostringstream out;
    TerminalDecisionSource src(in, out);

    EXPECT_TRUE(src.Confirm("Continue?", false));
    EXPECT_TRUE(src.Confirm("Continue?", true));
    EXPECT_FALSE(src.Confirm("Continue?", true));
    EXPECT_FALSE(src.Confirm("Continue?", false));
    EXPECT_NE(out.str().find("Continue? [Y/n]: "), std::string::npos);
    EXPECT_NE(out.str().find("Continue? [y/N]: "), std::string::npos);
}

TEST(TerminalDecisionSourceTest, ClosedInputFallsBackToDefault) {
    std::istringstream in("");
    std::ostringstream out;
    TerminalDecisionSource src(in, out);
    EXPECT_TRUE(src.Confirm("Start the service?", true));
    EXPECT_FALSE(src.ConfirmAction("Are you sure?"));
    EXPECT_EQ(src.Ask("Device key"), "");
}

TEST(TerminalDecisionSourceTest, AskTrimsAnswer) {
    std::istringstream in("  ABCD1234  \n");
    std::ostringstream out;
    TerminalDecisionSource src(in, out);
    EXPECT_EQ(src.Ask("Device key"), "ABCD1234");
    EXPECT_EQ(out.str(), "Device key: ");
}

TEST(TerminalDecisionSourceTest, ChooseParsesMenuAnswers) {
    const std::vector<std::string> branches{"main", "dev", "feature/rtsp"};

    std::istringstream in("2\n\n7\nabc\n");
    std::ostringstream out;
    TerminalDecisionSource src(in, out);

    EXPECT_EQ(src.Choose("Available branches:", branches, 0), std::optional<std::size_t>{1});
    EXPECT_EQ(src.Choose("Available branches:", branches, 0), std::optional<std::size_t>{0});
    EXPECT_EQ(src.Choose("Available branches:", branches, 0), std::nullopt);
    EXPECT_EQ(src.Choose("Available branches:", branches, 0), std::nullopt);
    EXPECT_NE(out.str().find("  1) main (default)"), std::string::npos);
    EXPECT_NE(out.str().find("  3) feature/rtsp"), std::string::npos);
}

TEST(PolicyDecisionSourceTest, TakesDefaultsAndApprovesActions) {
    PolicyDecisionSource src;
    EXPECT_FALSE(src.IsInteractive());
    EXPECT_TRUE(src.Confirm("Start the service?", true));
    EXPECT_FALSE(src.Confirm("Remove the system user?", false));
    EXPECT_TRUE(src.ConfirmAction("Are you sure you want to uninstall?"));
    EXPECT_EQ(src.Ask("Device key"), "");
    EXPECT_EQ(src.Choose("Available branches:", {"main", "dev"}, 0), std::optional<std::size_t>{0});
    EXPECT_EQ(src.Choose("Available branches:", {}, 0), std::nullopt);
}

} // namespace mdeploy

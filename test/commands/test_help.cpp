#include <gtest/gtest.h>

#include <sstream>

#include "cli/CommandFactory.hpp"
#include "cli/commands/CommitsCommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/ReportCommand.hpp"

using namespace mergereport;

class HelpCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Register all commands (normally done in main.cpp)
        auto& f = CommandFactory::instance();
        f.registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
        f.registerCreator("report", [] { return std::make_unique<ReportCommand>(); });
        f.registerCreator("commits", [] { return std::make_unique<CommitsCommand>(); });
        f.setDefaultCommand("report");
        ctx.out = &out;
    }

    std::ostringstream out;
    AppContext ctx;
};

// Test: Listing shows every registered command
TEST_F(HelpCommandTest, ListsCommands) {
    HelpCommand help;
    ASSERT_TRUE(help.execute(ctx, {}).has_value());
    std::string text = out.str();
    EXPECT_NE(text.find("report"), std::string::npos);
    EXPECT_NE(text.find("commits"), std::string::npos);
    EXPECT_NE(text.find("help"), std::string::npos);
    EXPECT_NE(text.find("MERGE_REPORT_LOG"), std::string::npos);
}

// Test: Detail page for a command lists its options
TEST_F(HelpCommandTest, CommandDetail) {
    HelpCommand help;
    ASSERT_TRUE(help.execute(ctx, {"report"}).has_value());
    std::string text = out.str();
    EXPECT_NE(text.find("SYNOPSIS:"), std::string::npos);
    EXPECT_NE(text.find("--from <rev>"), std::string::npos);
    EXPECT_NE(text.find("--inclusive"), std::string::npos);
}

// Test: Unknown topic falls back to the listing
TEST_F(HelpCommandTest, UnknownTopic) {
    HelpCommand help;
    ASSERT_TRUE(help.execute(ctx, {"frobnicate"}).has_value());
    EXPECT_NE(out.str().find("Commands:"), std::string::npos);
}

// Test: Command line resolution
TEST_F(HelpCommandTest, ResolveCommandLine) {
    auto& f = CommandFactory::instance();

    auto empty = f.resolve({});
    EXPECT_EQ(empty.first, "help");
    EXPECT_TRUE(empty.second.empty());

    auto leadingOption = f.resolve({"--from", "a", "--to", "b"});
    EXPECT_EQ(leadingOption.first, "report");
    EXPECT_EQ(leadingOption.second.size(), 4u);

    auto named = f.resolve({"commits", "--from", "a"});
    EXPECT_EQ(named.first, "commits");
    ASSERT_EQ(named.second.size(), 2u);
    EXPECT_EQ(named.second[0], "--from");

    EXPECT_EQ(f.resolve({"--help"}).first, "help");
    EXPECT_TRUE(f.create("nope") == nullptr);
}

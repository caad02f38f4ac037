#include <gtest/gtest.h>
#include <algorithm>
#include <deque>
#include "quorum/cli/cli_interface.h"

namespace quorum {
namespace cli {

class CLIInterfaceTest : public ::testing::Test {
protected:
    CLIInterface cli;
    std::vector<std::string> lines;
    std::deque<std::string> input;

    void SetUp() override {
        cli.setOutputCallback([this](const std::string& message) { lines.push_back(message); });
        cli.setInputCallback([this]() -> std::optional<std::string> {
            if (input.empty()) {
                return std::nullopt;
            }
            std::string line = input.front();
            input.pop_front();
            return line;
        });
    }

    bool printed(const std::string& text) const {
        return std::any_of(lines.begin(), lines.end(), [&](const std::string& line) {
            return line.find(text) != std::string::npos;
        });
    }
};

TEST_F(CLIInterfaceTest, Commands) {
    EXPECT_TRUE(cli.hasCommand("play"));
    EXPECT_TRUE(cli.hasCommand("MOVES"));
    EXPECT_FALSE(cli.hasCommand("resign"));
    EXPECT_FALSE(cli.executeCommand("resign", {}));
}

TEST_F(CLIInterfaceTest, PlayAMove) {
    EXPECT_TRUE(cli.executeCommand("play", {"b1-d3"}));

    EXPECT_TRUE(printed("Move played: b1-d3"));
    EXPECT_TRUE(printed("Black to move"));
    EXPECT_EQ(cli.getSession().state().ply(), 1);
}

TEST_F(CLIInterfaceTest, RejectedMoves) {
    EXPECT_FALSE(cli.executeCommand("play", {}));
    EXPECT_TRUE(printed("Missing move"));

    EXPECT_FALSE(cli.executeCommand("play", {"b1"}));
    EXPECT_TRUE(printed("Invalid move: b1"));

    EXPECT_FALSE(cli.executeCommand("play", {"a1-c1"}));
    EXPECT_TRUE(printed("Illegal move a1-c1: target must be an empty square on the board"));

    EXPECT_FALSE(cli.executeCommand("place", {}));
    EXPECT_TRUE(printed("Illegal move ++"));

    EXPECT_EQ(cli.getSession().state().ply(), 0);
}

TEST_F(CLIInterfaceTest, ListMoves) {
    EXPECT_TRUE(cli.executeCommand("moves", {}));
    ASSERT_FALSE(lines.empty());
    EXPECT_EQ(lines.back().find("9 legal plays: a1-c3 a2-c4"), 0u);
}

TEST_F(CLIInterfaceTest, InfoUndoAndHistory) {
    EXPECT_FALSE(cli.executeCommand("undo", {}));
    EXPECT_TRUE(printed("Nothing to undo."));

    cli.executeCommand("history", {});
    EXPECT_EQ(lines.back(), "No moves yet.");

    cli.executeCommand("play", {"b1-d3"});
    cli.executeCommand("play", {"g8-e6"});
    cli.executeCommand("history", {});
    EXPECT_EQ(lines.back(), " 1. b1-d3  g8-e6");

    cli.executeCommand("info", {});
    EXPECT_TRUE(printed("To move: White"));
    EXPECT_TRUE(printed("Move: 2 (ply 2)"));
    EXPECT_TRUE(printed("Stones: White 10, Black 10"));
    EXPECT_TRUE(printed("Win progress: 0"));
    EXPECT_TRUE(printed("No-play policy: pass"));

    EXPECT_TRUE(cli.executeCommand("undo", {}));
    EXPECT_TRUE(printed("Move undone."));
    EXPECT_EQ(cli.getSession().state().ply(), 1);

    EXPECT_TRUE(cli.executeCommand("new", {}));
    EXPECT_EQ(cli.getSession().state().ply(), 0);
}

TEST_F(CLIInterfaceTest, Help) {
    EXPECT_TRUE(cli.executeCommand("help", {}));
    EXPECT_TRUE(printed("  play - Make a move."));
    EXPECT_TRUE(printed("  quit - Quit the program."));

    EXPECT_TRUE(cli.executeCommand("help", {"undo"}));
    EXPECT_EQ(lines.back(), "Undo the last move. Usage: undo");

    EXPECT_FALSE(cli.executeCommand("help", {"resign"}));
}

TEST_F(CLIInterfaceTest, RunScript) {
    input = {"", "PLAY b1-d3", "resign", "moves", "quit", "play g8-e6"};

    EXPECT_EQ(cli.run(), 0);

    EXPECT_EQ(lines.front(), "Quorum");
    EXPECT_TRUE(printed("Move played: b1-d3"));
    EXPECT_TRUE(printed("Unknown command: resign"));
    EXPECT_TRUE(printed("9 legal plays: f8-d8"));
    // Nothing after quit runs
    EXPECT_EQ(input.size(), 1u);
    EXPECT_EQ(cli.getSession().state().ply(), 1);
}

TEST_F(CLIInterfaceTest, RunStopsAtEndOfInput) {
    input = {"play b1-d3"};
    EXPECT_EQ(cli.run(), 0);
    EXPECT_EQ(cli.getSession().state().ply(), 1);
}

} // namespace cli
} // namespace quorum

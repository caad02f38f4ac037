// src/cli/cli_interface.cpp
#include "quorum/cli/cli_interface.h"
#include "quorum/cli/command_parser.h"
#include "quorum/rules/move_generator.h"
#include "quorum/rules/win_checker.h"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>

namespace quorum {
namespace cli {

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

CLIInterface::CLIInterface(const config::EngineConfig& config)
    : config_(config),
      session_(std::make_unique<game::GameSession>(config)) {

    outputCallback_ = [](const std::string& message) {
        std::cout << message << std::endl;
    };

    inputCallback_ = []() -> std::optional<std::string> {
        std::string line;
        if (!std::getline(std::cin, line)) {
            return std::nullopt;
        }
        return line;
    };

    registerCommands();
}

int CLIInterface::run() {
    output("Quorum");
    output("======");
    output("Type 'help' for a list of commands.");

    while (true) {
        auto line = inputCallback_();
        if (!line) {
            break;
        }

        std::vector<std::string> tokens = CommandParser::tokenize(*line);
        if (tokens.empty()) {
            continue;
        }

        std::string command = lowercase(tokens[0]);
        std::vector<std::string> args(tokens.begin() + 1, tokens.end());

        if (command == "quit" || command == "exit") {
            break;
        }

        if (!hasCommand(command)) {
            output("Unknown command: " + command);
            output("Type 'help' for a list of commands.");
            continue;
        }

        executeCommand(command, args);
    }

    return 0;
}

bool CLIInterface::hasCommand(const std::string& command) const {
    return commands_.find(lowercase(command)) != commands_.end();
}

bool CLIInterface::executeCommand(const std::string& command, const std::vector<std::string>& args) {
    auto it = commands_.find(lowercase(command));
    if (it == commands_.end()) {
        return false;
    }
    return it->second(args);
}

void CLIInterface::setOutputCallback(std::function<void(const std::string&)> callback) {
    if (callback) {
        outputCallback_ = callback;
    }
}

void CLIInterface::setInputCallback(std::function<std::optional<std::string>()> callback) {
    if (callback) {
        inputCallback_ = callback;
    }
}

void CLIInterface::registerCommands() {
    commands_["help"] = [this](const std::vector<std::string>& args) { return cmdHelp(args); };
    commandHelp_["help"] = "Display help information. Usage: help [command]";

    commands_["new"] = [this](const std::vector<std::string>& args) { return cmdNew(args); };
    commandHelp_["new"] = "Start a new game. Usage: new";

    commands_["play"] = [this](const std::vector<std::string>& args) { return cmdPlay(args); };
    commandHelp_["play"] = "Make a move. Usage: play <origin-target> (e.g. play b1-d3) or play ++";

    commands_["place"] = [this](const std::vector<std::string>& args) { return cmdPlace(args); };
    commandHelp_["place"] = "Fill every empty home square. Usage: place";

    commands_["moves"] = [this](const std::vector<std::string>& args) { return cmdMoves(args); };
    commandHelp_["moves"] = "List the legal plays. Usage: moves";

    commands_["show"] = [this](const std::vector<std::string>& args) { return cmdShow(args); };
    commandHelp_["show"] = "Show the current board. Usage: show";

    commands_["info"] = [this](const std::vector<std::string>& args) { return cmdInfo(args); };
    commandHelp_["info"] = "Show information about the current game. Usage: info";

    commands_["undo"] = [this](const std::vector<std::string>& args) { return cmdUndo(args); };
    commandHelp_["undo"] = "Undo the last move. Usage: undo";

    commands_["history"] = [this](const std::vector<std::string>& args) { return cmdHistory(args); };
    commandHelp_["history"] = "Show the move list. Usage: history";

    commandHelp_["quit"] = "Quit the program. Usage: quit";
}

void CLIInterface::output(const std::string& message) {
    outputCallback_(message);
}

void CLIInterface::reportResult() {
    const auto& state = session_->state();
    if (!state.isTerminal()) {
        if (auto passed = state.passedColor()) {
            output(core::colorName(*passed) + " has no legal play and passes.");
        }
        return;
    }

    if (auto winner = state.winner()) {
        output("Game over: " + core::colorName(*winner) + " wins (" +
               core::resultToString(state.result()) + ")");
    } else {
        output("Game over: Draw (" + core::resultToString(state.result()) + ")");
    }
}

bool CLIInterface::cmdHelp(const std::vector<std::string>& args) {
    if (args.empty()) {
        output("Available commands:");
        for (const auto& entry : commandHelp_) {
            output("  " + entry.first + " - " + entry.second);
        }
        return true;
    }

    auto it = commandHelp_.find(lowercase(args[0]));
    if (it == commandHelp_.end()) {
        output("Unknown command: " + args[0]);
        return false;
    }
    output(it->second);
    return true;
}

bool CLIInterface::cmdNew(const std::vector<std::string>& args) {
    (void)args;
    session_->reset();
    output("New game started.");
    return cmdShow({});
}

bool CLIInterface::cmdPlay(const std::vector<std::string>& args) {
    if (args.empty()) {
        output("Missing move. Usage: play <move>");
        return false;
    }

    try {
        session_->play(args[0]);
    } catch (const core::NotationException& e) {
        output("Invalid move: " + e.getText());
        return false;
    } catch (const core::IllegalPlayException& e) {
        output("Illegal move " + e.getPlay() + ": " + core::reasonToString(e.getReason()));
        return false;
    }

    output("Move played: " + core::toNotation(*session_->state().lastPlay()));
    cmdShow({});
    reportResult();
    return true;
}

bool CLIInterface::cmdPlace(const std::vector<std::string>& args) {
    (void)args;
    return cmdPlay({"++"});
}

bool CLIInterface::cmdMoves(const std::vector<std::string>& args) {
    (void)args;
    const auto& state = session_->state();
    if (state.isTerminal()) {
        output("Game is already over.");
        return true;
    }

    auto plays = rules::MoveGenerator::legalPlays(state);
    std::stringstream ss;
    ss << plays.size() << " legal plays:";
    for (const auto& play : plays) {
        ss << ' ' << core::toNotation(play);
    }
    output(ss.str());
    return true;
}

bool CLIInterface::cmdShow(const std::vector<std::string>& args) {
    (void)args;
    output(session_->state().toString());
    return true;
}

bool CLIInterface::cmdInfo(const std::vector<std::string>& args) {
    (void)args;
    const auto& state = session_->state();
    const auto& board = state.board();

    output("To move: " + core::colorName(state.currentPlayer()));
    output("Move: " + std::to_string(state.moveNumber()) + " (ply " + std::to_string(state.ply()) + ")");
    output("Stones: White " + std::to_string(board.countStones(core::Color::WHITE)) +
           ", Black " + std::to_string(board.countStones(core::Color::BLACK)));
    output("Win progress: " + std::to_string(rules::WinChecker::objectiveBalance(board)));
    output("Result: " + core::resultToString(state.result()));
    output("No-play policy: " + config::policyToString(config_.no_play_policy));
    return true;
}

bool CLIInterface::cmdUndo(const std::vector<std::string>& args) {
    (void)args;
    if (!session_->undo()) {
        output("Nothing to undo.");
        return false;
    }
    output("Move undone.");
    return cmdShow({});
}

bool CLIInterface::cmdHistory(const std::vector<std::string>& args) {
    (void)args;
    std::string sheet = session_->scoresheet();
    output(sheet.empty() ? "No moves yet." : sheet);
    return true;
}

} // namespace cli
} // namespace quorum

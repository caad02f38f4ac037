// src/game/game_session.cpp
#include "quorum/game/game_session.h"
#include <iomanip>
#include <sstream>

namespace quorum {
namespace game {

namespace {

const char* PASS_TEXT = "--";
constexpr int ENTRY_WIDTH = 6;

std::string rtrim(std::string line) {
    line.erase(line.find_last_not_of(' ') + 1);
    return line;
}

} // namespace

GameSession::GameSession(const config::EngineConfig& config)
    : controller_(config) {
    states_.push_back(controller_.initialState());
}

GameSession::GameSession(const core::GameState& start, const config::EngineConfig& config)
    : controller_(config) {
    states_.push_back(start);
}

const core::GameState& GameSession::play(const core::Play& play) {
    states_.push_back(controller_.apply(state(), play));
    return state();
}

const core::GameState& GameSession::play(const std::string& notation) {
    auto parsed = core::parsePlay(notation, state().board(), state().currentPlayer());
    if (!parsed) {
        throw core::NotationException("Malformed play: '" + notation + "'", notation);
    }
    return play(*parsed);
}

bool GameSession::undo() {
    if (states_.size() <= 1) {
        return false;
    }
    states_.pop_back();
    return true;
}

void GameSession::reset() {
    states_.erase(states_.begin() + 1, states_.end());
}

std::vector<core::Play> GameSession::history() const {
    std::vector<core::Play> plays;
    for (size_t i = 1; i < states_.size(); i++) {
        plays.push_back(*states_[i].lastPlay());
    }
    return plays;
}

std::string GameSession::scoresheet() const {
    std::vector<std::string> entries;
    for (size_t i = 1; i < states_.size(); i++) {
        entries.push_back(core::toNotation(*states_[i].lastPlay()));
        if (states_[i].passedColor()) {
            entries.push_back(PASS_TEXT);
        }
    }
    if (state().isTerminal()) {
        entries.push_back(core::resultToString(state().result()));
    }

    std::stringstream ss;
    for (size_t i = 0; i < entries.size(); i += 2) {
        std::stringstream line;
        line << std::setw(3) << std::right << (std::to_string(i / 2 + 1) + ".") << ' ';
        line << std::setw(ENTRY_WIDTH) << std::left << entries[i];
        if (i + 1 < entries.size()) {
            line << ' ' << std::setw(ENTRY_WIDTH) << std::left << entries[i + 1];
        }
        if (i > 0) {
            ss << std::endl;
        }
        ss << rtrim(line.str());
    }
    return ss.str();
}

} // namespace game
} // namespace quorum

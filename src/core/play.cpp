// src/core/play.cpp
#include "quorum/core/play.h"
#include <algorithm>
#include <cctype>

namespace quorum {
namespace core {

namespace {

const char* PLACEMENT_TEXT = "++";

std::string trimmed(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(text.rbegin(), text.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

std::string toNotation(const Play& play) {
    if (const auto* movement = std::get_if<Movement>(&play)) {
        return movement->active.toString() + "-" + movement->target().toString();
    }
    return PLACEMENT_TEXT;
}

std::optional<Play> parsePlay(const std::string& text, const Board& board, Color mover) {
    std::string input = trimmed(text);

    if (input == "+" || input == PLACEMENT_TEXT) {
        return Play(Placement{board.emptyHomeSquares(mover)});
    }

    std::string origin_text;
    std::string target_text;
    if (input.size() == 5 && input[2] == '-') {
        origin_text = input.substr(0, 2);
        target_text = input.substr(3, 2);
    } else if (input.size() == 4) {
        origin_text = input.substr(0, 2);
        target_text = input.substr(2, 2);
    } else {
        return std::nullopt;
    }

    auto origin = Square::fromString(origin_text);
    auto target = Square::fromString(target_text);
    if (!origin || !target) {
        return std::nullopt;
    }

    // The center must be a whole square halfway between origin and target
    int df = target->file - origin->file;
    int dr = target->rank - origin->rank;
    if (df % 2 != 0 || dr % 2 != 0) {
        return std::nullopt;
    }

    Square center(origin->file + df / 2, origin->rank + dr / 2);
    return Play(Movement{*origin, center});
}

} // namespace core
} // namespace quorum

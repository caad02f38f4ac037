// include/quorum/core/quorum_types.h
#ifndef QUORUM_TYPES_H
#define QUORUM_TYPES_H

#include <string>
#include <optional>
#include <stdexcept>
#include <utility>

namespace quorum {
namespace core {

/**
 * @brief Stone colors. White moves first.
 */
enum class Color {
    WHITE,
    BLACK
};

/**
 * @brief Result of a game
 */
enum class GameResult {
    ONGOING,
    WHITE_WINS,
    BLACK_WINS,
    DRAW
};

/**
 * @brief Reason a play was rejected
 */
enum class IllegalPlayReason {
    GAME_OVER,       // the game already has a result
    OWNERSHIP,       // active or center square does not hold a mover stone
    DISTANCE,        // active and center are not adjacent
    SPACE,           // target is off the board or occupied
    HOME_OCCUPANCY   // placement squares differ from the empty home squares
};

inline Color opponent(Color color) {
    return color == Color::WHITE ? Color::BLACK : Color::WHITE;
}

inline std::string colorName(Color color) {
    return color == Color::WHITE ? "White" : "Black";
}

inline GameResult winFor(Color color) {
    return color == Color::WHITE ? GameResult::WHITE_WINS : GameResult::BLACK_WINS;
}

/**
 * @brief Winning color of a result, empty for ongoing games and draws
 */
inline std::optional<Color> winnerOf(GameResult result) {
    switch (result) {
        case GameResult::WHITE_WINS: return Color::WHITE;
        case GameResult::BLACK_WINS: return Color::BLACK;
        default: return std::nullopt;
    }
}

/**
 * @brief Score-sheet text of a result ("1-0", "0-1", "1/2-1/2" or "*")
 */
std::string resultToString(GameResult result);

std::string reasonToString(IllegalPlayReason reason);

/**
 * @brief Base exception for engine errors
 */
class QuorumException : public std::runtime_error {
public:
    explicit QuorumException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Exception for plays that are not legal in the current state
 */
class IllegalPlayException : public QuorumException {
public:
    IllegalPlayException(const std::string& message, IllegalPlayReason reason, std::string play)
        : QuorumException(message), reason_(reason), play_(std::move(play)) {}
    IllegalPlayReason getReason() const { return reason_; }
    const std::string& getPlay() const { return play_; }
private:
    IllegalPlayReason reason_;
    std::string play_;
};

/**
 * @brief Exception for malformed square or play text
 */
class NotationException : public QuorumException {
public:
    NotationException(const std::string& message, std::string text)
        : QuorumException(message), text_(std::move(text)) {}
    const std::string& getText() const { return text_; }
private:
    std::string text_;
};

/**
 * @brief Exception for unreadable or invalid configuration
 */
class ConfigException : public QuorumException {
public:
    explicit ConfigException(const std::string& message)
        : QuorumException(message) {}
};

} // namespace core
} // namespace quorum

#endif // QUORUM_TYPES_H

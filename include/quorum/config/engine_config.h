// include/quorum/config/engine_config.h
#ifndef QUORUM_ENGINE_CONFIG_H
#define QUORUM_ENGINE_CONFIG_H

#include <string>

namespace quorum {
namespace config {

/**
 * @brief What happens when the player to move has no legal play
 */
enum class NoPlayPolicy {
    PASS,  // the turn is skipped; a draw if both players are stuck
    LOSE   // the stuck player loses
};

/**
 * @brief Engine settings
 */
struct EngineConfig {
    std::string log_level = "info";
    NoPlayPolicy no_play_policy = NoPlayPolicy::PASS;
    bool check_win_after_placement = true;

    /**
     * @brief Serialize to JSON
     *
     * @return JSON string representation
     */
    std::string toJson() const;

    /**
     * @brief Deserialize from JSON
     *
     * Missing keys keep their defaults and unknown keys are ignored.
     *
     * @param json JSON string
     * @return EngineConfig object
     * @throws core::ConfigException on malformed JSON or bad values
     */
    static EngineConfig fromJson(const std::string& json);

    /**
     * @brief Load from file
     *
     * @param filename Filename to load from
     * @return EngineConfig object
     * @throws core::ConfigException if the file cannot be read or parsed
     */
    static EngineConfig loadFromFile(const std::string& filename);
};

std::string policyToString(NoPlayPolicy policy);

/**
 * @brief Parse "pass" or "lose"
 *
 * @throws core::ConfigException for anything else
 */
NoPlayPolicy policyFromString(const std::string& text);

/**
 * @brief Set the spdlog level from the configuration
 *
 * @throws core::ConfigException for an unknown level name
 */
void applyLogging(const EngineConfig& config);

} // namespace config
} // namespace quorum

#endif // QUORUM_ENGINE_CONFIG_H

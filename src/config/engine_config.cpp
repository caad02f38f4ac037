// src/config/engine_config.cpp
#include "quorum/config/engine_config.h"
#include "quorum/core/quorum_types.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace quorum {
namespace config {

using json = nlohmann::json;

namespace {

const char* KEY_LOG_LEVEL = "log_level";
const char* KEY_NO_PLAY_POLICY = "no_play_policy";
const char* KEY_CHECK_WIN_AFTER_PLACEMENT = "check_win_after_placement";

spdlog::level::level_enum levelFromString(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str() maps unknown names to "off"
    if (level == spdlog::level::off && name != "off") {
        throw core::ConfigException("Unknown log level: " + name);
    }
    return level;
}

} // namespace

std::string policyToString(NoPlayPolicy policy) {
    return policy == NoPlayPolicy::LOSE ? "lose" : "pass";
}

NoPlayPolicy policyFromString(const std::string& text) {
    if (text == "pass") {
        return NoPlayPolicy::PASS;
    }
    if (text == "lose") {
        return NoPlayPolicy::LOSE;
    }
    throw core::ConfigException("Unknown no_play_policy: " + text);
}

std::string EngineConfig::toJson() const {
    json j;
    j[KEY_LOG_LEVEL] = log_level;
    j[KEY_NO_PLAY_POLICY] = policyToString(no_play_policy);
    j[KEY_CHECK_WIN_AFTER_PLACEMENT] = check_win_after_placement;

    return j.dump(4);
}

EngineConfig EngineConfig::fromJson(const std::string& jsonStr) {
    EngineConfig config;

    try {
        json j = json::parse(jsonStr);
        if (!j.is_object()) {
            throw core::ConfigException("Configuration must be a JSON object");
        }

        if (j.contains(KEY_LOG_LEVEL)) {
            config.log_level = j[KEY_LOG_LEVEL].get<std::string>();
            levelFromString(config.log_level);
        }
        if (j.contains(KEY_NO_PLAY_POLICY)) {
            config.no_play_policy = policyFromString(j[KEY_NO_PLAY_POLICY].get<std::string>());
        }
        if (j.contains(KEY_CHECK_WIN_AFTER_PLACEMENT)) {
            config.check_win_after_placement = j[KEY_CHECK_WIN_AFTER_PLACEMENT].get<bool>();
        }
    } catch (const json::exception& e) {
        throw core::ConfigException("Failed to parse configuration: " + std::string(e.what()));
    }

    return config;
}

EngineConfig EngineConfig::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw core::ConfigException("Could not open file: " + filename);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    EngineConfig config = fromJson(buffer.str());
    spdlog::info("EngineConfig: Loaded {} (no_play_policy={}, check_win_after_placement={})",
                 filename, policyToString(config.no_play_policy), config.check_win_after_placement);
    return config;
}

void applyLogging(const EngineConfig& config) {
    spdlog::set_level(levelFromString(config.log_level));
}

} // namespace config
} // namespace quorum

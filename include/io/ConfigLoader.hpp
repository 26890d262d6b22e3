#pragma once

#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "talentmatch/MatchEngine.hpp"
#include "talentmatch/WeightConfig.hpp"

namespace talentmatch {

struct AppConfig {
    WeightConfiguration weights;
    EngineConfig engine;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// std::getenv; unset and empty both read as nullopt
std::optional<std::string> process_env(const std::string& name);

// {"weights": {...}, "cache": {...}, "ranking": {...}}, all sections optional.
// Throws ConfigError on unknown sections or badly typed values.
AppConfig parse_config(const nlohmann::json& j);

// WEIGHT_SKILLS, WEIGHT_TITLE_SIM, WEIGHT_SEMANTIC, WEIGHT_EMBEDDING, WEIGHT_DISTANCE,
// MUST_CATEGORY_WEIGHT, NEEDED_CATEGORY_WEIGHT, MIN_SKILL_FLOOR,
// MATCH_CACHE_CAPACITY, MATCH_CACHE_TTL (seconds).
void apply_env_overrides(AppConfig& cfg, const EnvLookup& env = process_env);

// Defaults, then the file (when path is non-empty), then the environment.
// Weight ranges are checked later, when the engine installs the weights.
AppConfig load_config(const std::string& path, const EnvLookup& env = process_env);

nlohmann::json config_to_json(const AppConfig& cfg);

}  // namespace talentmatch

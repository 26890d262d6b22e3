#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "talentmatch/CompositeScorer.hpp"
#include "talentmatch/Models.hpp"
#include "talentmatch/WeightConfig.hpp"

namespace talentmatch {

// Parse errors throw std::runtime_error naming the offending path,
// e.g. "root[3].skills_detailed[1].category must be one of: must, needed".

nlohmann::json read_json_file(const std::filesystem::path& path);
void write_json_file(const std::filesystem::path& path, const nlohmann::json& j);

Entity parse_entity(const nlohmann::json& j, const std::string& where);

// Accepts an array of entities or {"entities": [...]}.
std::vector<Entity> parse_entities(const nlohmann::json& j, const std::string& where = "root");
std::vector<Entity> load_entities(const std::filesystem::path& path);

// Half away from zero; wire scores use 4 decimals, distances 1.
double round_decimals(double x, int decimals);

nlohmann::json weights_to_json(const WeightConfiguration& w);

// Unknown keys are rejected; known keys must be numbers (min_skill_floor an integer).
WeightUpdate parse_weight_update(const nlohmann::json& j, const std::string& where);

nlohmann::json result_to_json(const MatchResult& r);
nlohmann::json results_to_json(const std::vector<MatchResult>& results);

}  // namespace talentmatch

#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "talentmatch/CompositeScorer.hpp"
#include "talentmatch/WeightConfig.hpp"

namespace talentmatch {

struct ComponentExplanation {
    Component component = Component::Skill;
    std::optional<double> raw;
    double weight = 0.0;
    double weighted = 0.0;
    bool included = false;
};

// Wire view of one scored pair. Built from a MatchResult without recomputing anything.
struct Explanation {
    std::string candidate_id;
    std::string job_id;
    std::string anchor_id;
    EntityKind anchor_kind = EntityKind::Candidate;

    double score = 0.0;
    std::uint64_t weights_version = 0;
    std::optional<WeightConfiguration> weights;  // set by the caller when the snapshot is at hand

    std::array<ComponentExplanation, kComponentCount> components;
    double weight_sum = 0.0;

    std::vector<std::string> skill_overlap;
    std::vector<std::string> candidate_only_skills;
    std::vector<std::string> job_only_skills;

    double must_ratio = 0.0;
    double needed_ratio = 0.0;
    double weighted_skill_score = 0.0;
    double base_skill_overlap = 0.0;

    std::optional<double> title_similarity;
    std::optional<double> semantic_similarity;
    std::optional<double> embedding_similarity;
    std::optional<double> distance_km;
    std::optional<double> distance_score;

    std::vector<RequirementCheck> skills_must_list;
    std::vector<RequirementCheck> skills_nice_list;

    bool low_skill_floor = false;
    bool degenerate_weights = false;
    bool skills_categorized = true;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

// Throws MatchError when `r` was scored without a breakdown.
Explanation explain_match(const MatchResult& r);

}  // namespace talentmatch

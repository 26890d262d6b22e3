#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "talentmatch/Errors.hpp"

namespace talentmatch {

struct WeightConfiguration {
    // composite components, each in [0,1]
    double skill = 0.85;
    double title = 0.15;
    double semantic = 0.0;
    double embedding = 0.0;
    double distance = 0.35;

    // category sub-weights inside the skill component, each in [0,1]
    double must = 0.7;
    double needed = 0.3;

    // informational: pairs below it are flagged, never penalized
    int min_skill_floor = 3;

    // assigned by WeightStore; 0 means "never installed"
    std::uint64_t version = 0;
};

// Partial update: unset fields keep their current value.
struct WeightUpdate {
    std::optional<double> skill;
    std::optional<double> title;
    std::optional<double> semantic;
    std::optional<double> embedding;
    std::optional<double> distance;
    std::optional<double> must;
    std::optional<double> needed;
    std::optional<int> min_skill_floor;

    bool empty() const;
};

// Hard checks: each weight finite and in [0,1], min_skill_floor >= 0.
std::vector<ValidationIssue> validate_weights(const WeightConfiguration& w);

// Soft checks (top-level sum, category sum far from 1). Logged, never enforced.
std::vector<std::string> weight_warnings(const WeightConfiguration& w);

// Copy of `base` with `u` applied. Version is carried over untouched.
WeightConfiguration apply_update(const WeightConfiguration& base, const WeightUpdate& u);

}  // namespace talentmatch

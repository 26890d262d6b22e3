#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "talentmatch/Models.hpp"
#include "talentmatch/SkillScorer.hpp"
#include "talentmatch/WeightConfig.hpp"

namespace talentmatch {

enum class Component {
    Skill,
    Title,
    Semantic,
    Embedding,
    Distance
};

constexpr size_t kComponentCount = 5;

const char* component_str(Component c);

struct ComponentValue {
    std::optional<double> raw;  // nullopt: not computable for this pair, excluded from the sum
    double weight = 0.0;        // configured weight
    double weighted = 0.0;      // weight * raw, 0 when absent

    bool included() const { return raw.has_value(); }
};

struct MatchBreakdown {
    std::array<ComponentValue, kComponentCount> components;
    SkillScore skills;
    std::optional<double> distance_km;

    double weight_sum = 0.0;          // sum of weights over included components
    bool degenerate_weights = false;  // weight_sum was 0, score fell back to skill alone

    const ComponentValue& at(Component c) const { return components[static_cast<size_t>(c)]; }
    ComponentValue& at(Component c) { return components[static_cast<size_t>(c)]; }
};

struct MatchResult {
    std::string anchor_id;
    EntityKind anchor_kind = EntityKind::Candidate;
    std::string counterpart_id;
    EntityKind counterpart_kind = EntityKind::Job;

    double score = 0.0;                  // [0,1]
    std::uint64_t weights_version = 0;   // snapshot the score was computed with
    std::string tie_break_key;           // counterpart id

    std::optional<MatchBreakdown> breakdown;
};

// All five components for one pair, weights attached, not yet combined.
MatchBreakdown compute_components(const Entity& anchor, const Entity& counterpart, const WeightConfiguration& w);

// Renormalized weighted mean over included components, clamped to [0,1].
// Marks the breakdown degenerate when no included component carries weight.
double combine(MatchBreakdown& b);

MatchResult score_pair(const Entity& anchor, const Entity& counterpart,
                       const WeightConfiguration& w, bool keep_breakdown = true);

// Smallest usable tie_epsilon; finer values compare scores exactly.
constexpr double kMinTieEpsilon = 1e-12;

// Score descending; scores within tie_epsilon of each other ordered by counterpart id ascending.
void sort_results(std::vector<MatchResult>& results, double tie_epsilon);

}  // namespace talentmatch

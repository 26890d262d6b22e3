#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "talentmatch/CompositeScorer.hpp"
#include "talentmatch/Models.hpp"
#include "talentmatch/WeightConfig.hpp"

namespace talentmatch {

struct RankQuery {
    size_t top_k = 5;                       // 0 returns every scored member
    bool city_filter = true;
    std::optional<double> max_distance_km;
    bool drop_zero_scores = true;
    bool include_breakdown = false;
};

// Stable textual form of everything that shapes a ranking for this anchor.
// Used as the query part of the cache key.
std::string canonical_query(const Entity& anchor, const RankQuery& q);

struct RankLimits {
    double tie_epsilon = 1e-9;
    size_t max_pool_size = 1000;
    unsigned parallelism = 1;
    std::chrono::milliseconds time_budget{0};  // 0 = unbounded
};

struct Ranking {
    std::vector<MatchResult> results;

    size_t scored = 0;            // members that reached the composite scorer
    size_t rejected_tenant = 0;   // other tenants, never scored
    size_t skipped_kind = 0;      // same kind as the anchor
    size_t capped = 0;            // beyond max_pool_size
    size_t filtered = 0;          // city / max-distance pre-filters
    size_t dropped_zero = 0;
    bool truncated = false;       // time budget ran out
};

// Throws NotFound when the anchor has no tenant. Cross-tenant members are
// dropped before any score is computed.
Ranking rank_pool(const Entity& anchor, const std::vector<Entity>& pool, const RankQuery& q,
                  const WeightConfiguration& w, const RankLimits& limits = {});

// Single pair, breakdown always attached. Throws TenantMismatch across tenants.
MatchResult explain_pair(const Entity& anchor, const Entity& counterpart, const WeightConfiguration& w);

}  // namespace talentmatch

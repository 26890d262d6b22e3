#pragma once

#include <string>
#include <vector>

#include "talentmatch/EntityStore.hpp"
#include "talentmatch/MatchCache.hpp"
#include "talentmatch/Ranker.hpp"
#include "talentmatch/WeightStore.hpp"

namespace talentmatch {

struct EngineConfig {
    MatchCacheConfig cache;
    RankLimits limits;
};

// Entry point for callers: tenant guard, cached ranking, fresh explanations
// and weight updates over one WeightStore and one MatchCache.
class MatchEngine {
public:
    // Throws ConfigError when `initial` does not validate.
    explicit MatchEngine(const WeightConfiguration& initial = {}, EngineConfig cfg = {});

    // Cached by (anchor tenant, canonical_query, weights version). The pool is
    // taken as what the store would return for this anchor; a different pool
    // under the same key is not detected.
    std::vector<MatchResult> rank(const Entity& anchor, const std::vector<Entity>& pool, const RankQuery& q);

    // Loads the anchor and a pool of the opposite kind. Throws NotFound.
    std::vector<MatchResult> rank_by_id(const EntityStore& store, const std::string& tenant_id,
                                        const std::string& anchor_id, const RankQuery& q);

    // Never cached.
    MatchResult explain(const Entity& anchor, const Entity& counterpart) const;
    MatchResult explain_by_id(const EntityStore& store, const std::string& tenant_id,
                              const std::string& anchor_id, const std::string& counterpart_id) const;

    // Throw ValidationError and leave the weights unchanged on bad input.
    WeightSnapshot update_weights(const WeightUpdate& u);
    WeightSnapshot replace_weights(const WeightConfiguration& w);

    WeightSnapshot weights() const { return m_weights.snapshot(); }

    void clear_cache() { m_cache.clear(); }
    CacheStats cache_stats() const { return m_cache.stats(); }

private:
    EngineConfig m_cfg;
    WeightStore m_weights;
    MatchCache m_cache;
};

}  // namespace talentmatch

#include "talentmatch/MatchEngine.hpp"

#include <iostream>

#include "talentmatch/Errors.hpp"
#include "talentmatch/TenantGuard.hpp"

namespace talentmatch {

MatchEngine::MatchEngine(const WeightConfiguration& initial, EngineConfig cfg)
    : m_cfg(cfg), m_weights(initial), m_cache(cfg.cache) {}

std::vector<MatchResult> MatchEngine::rank(const Entity& anchor, const std::vector<Entity>& pool, const RankQuery& q) {
    require_tenant(anchor);

    const WeightSnapshot w = m_weights.snapshot();
    const CacheKey key{anchor.tenant_id, canonical_query(anchor, q), w->version};

    if (auto hit = m_cache.get(key)) return std::move(*hit);

    Ranking r = rank_pool(anchor, pool, q, *w, m_cfg.limits);

    if (r.rejected_tenant > 0) {
        std::cerr << "MatchEngine: dropped " << r.rejected_tenant
                  << " cross-tenant pool members for " << kind_str(anchor.kind) << " " << anchor.id << "\n";
    }
    if (r.capped > 0) {
        std::cerr << "MatchEngine: pool capped at " << m_cfg.limits.max_pool_size
                  << ", " << r.capped << " members not scored\n";
    }
    if (r.truncated) {
        std::cerr << "MatchEngine: time budget of " << m_cfg.limits.time_budget.count()
                  << " ms exceeded after " << r.scored << " members, ranking not cached\n";
        return std::move(r.results);
    }

    m_cache.put(key, r.results);
    return std::move(r.results);
}

std::vector<MatchResult> MatchEngine::rank_by_id(const EntityStore& store, const std::string& tenant_id,
                                                 const std::string& anchor_id, const RankQuery& q) {
    if (tenant_id.empty()) throw NotFound("entity", anchor_id);

    std::optional<Entity> anchor = store.get_entity(tenant_id, anchor_id);
    if (!anchor) throw NotFound("entity", anchor_id);

    PoolFilter filter;
    filter.kind = opposite(anchor->kind);
    filter.limit = m_cfg.limits.max_pool_size;

    const std::vector<Entity> pool = store.query_pool(tenant_id, filter);
    return rank(*anchor, pool, q);
}

MatchResult MatchEngine::explain(const Entity& anchor, const Entity& counterpart) const {
    require_same_tenant(anchor, counterpart);
    const WeightSnapshot w = m_weights.snapshot();
    return explain_pair(anchor, counterpart, *w);
}

MatchResult MatchEngine::explain_by_id(const EntityStore& store, const std::string& tenant_id,
                                       const std::string& anchor_id, const std::string& counterpart_id) const {
    if (tenant_id.empty()) throw NotFound("entity", anchor_id);

    std::optional<Entity> anchor = store.get_entity(tenant_id, anchor_id);
    if (!anchor) throw NotFound("entity", anchor_id);

    std::optional<Entity> counterpart = store.get_entity(tenant_id, counterpart_id);
    if (!counterpart) throw NotFound("entity", counterpart_id);

    return explain(*anchor, *counterpart);
}

WeightSnapshot MatchEngine::update_weights(const WeightUpdate& u) {
    return m_weights.update(u);
}

WeightSnapshot MatchEngine::replace_weights(const WeightConfiguration& w) {
    return m_weights.replace(w);
}

}  // namespace talentmatch

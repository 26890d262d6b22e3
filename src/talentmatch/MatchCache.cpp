#include "talentmatch/MatchCache.hpp"

#include <functional>

namespace talentmatch {

size_t CacheKeyHash::operator()(const CacheKey& k) const {
    size_t h = std::hash<std::string>{}(k.tenant_id);
    h ^= std::hash<std::string>{}(k.query) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    h ^= std::hash<std::uint64_t>{}(k.weights_version) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    return h;
}

MatchCache::MatchCache(MatchCacheConfig cfg) : m_cfg(cfg) {
    m_index.reserve(m_cfg.capacity * 2 + 8);
}

bool MatchCache::expired(const Entry& e, Clock::time_point now) const {
    if (m_cfg.ttl.count() <= 0) return false;
    return now - e.stored_at > m_cfg.ttl;
}

std::optional<std::vector<MatchResult>> MatchCache::get(const CacheKey& key) {
    std::lock_guard<std::mutex> lock(m_mu);

    auto it = m_index.find(key);
    if (it == m_index.end()) {
        ++m_stats.misses;
        return std::nullopt;
    }

    if (expired(*it->second, Clock::now())) {
        m_lru.erase(it->second);
        m_index.erase(it);
        ++m_stats.expirations;
        ++m_stats.misses;
        return std::nullopt;
    }

    m_lru.splice(m_lru.begin(), m_lru, it->second);
    ++m_stats.hits;
    return it->second->results;
}

void MatchCache::put(const CacheKey& key, std::vector<MatchResult> results) {
    if (m_cfg.capacity == 0) return;

    std::lock_guard<std::mutex> lock(m_mu);

    auto it = m_index.find(key);
    if (it != m_index.end()) {
        it->second->results = std::move(results);
        it->second->stored_at = Clock::now();
        m_lru.splice(m_lru.begin(), m_lru, it->second);
        return;
    }

    while (m_lru.size() >= m_cfg.capacity) {
        m_index.erase(m_lru.back().key);
        m_lru.pop_back();
        ++m_stats.evictions;
    }

    m_lru.push_front(Entry{key, std::move(results), Clock::now()});
    m_index.emplace(key, m_lru.begin());
}

void MatchCache::clear() {
    std::lock_guard<std::mutex> lock(m_mu);
    m_lru.clear();
    m_index.clear();
}

size_t MatchCache::size() const {
    std::lock_guard<std::mutex> lock(m_mu);
    return m_lru.size();
}

CacheStats MatchCache::stats() const {
    std::lock_guard<std::mutex> lock(m_mu);
    CacheStats s = m_stats;
    s.size = m_lru.size();
    return s;
}

}  // namespace talentmatch

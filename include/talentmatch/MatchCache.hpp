#pragma once

#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "talentmatch/CompositeScorer.hpp"

namespace talentmatch {

struct CacheKey {
    std::string tenant_id;
    std::string query;                  // canonical query parameters
    std::uint64_t weights_version = 0;

    bool operator==(const CacheKey& o) const {
        return weights_version == o.weights_version && tenant_id == o.tenant_id && query == o.query;
    }
};

struct CacheKeyHash {
    size_t operator()(const CacheKey& k) const;
};

struct MatchCacheConfig {
    size_t capacity = 256;                // 0 disables caching
    std::chrono::milliseconds ttl{900000};  // 15 minutes; 0 means entries never expire
};

struct CacheStats {
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t evictions = 0;
    std::uint64_t expirations = 0;
    size_t size = 0;
};

// Bounded LRU of ranked result lists. Safe to share between threads.
// Entries keyed to an old weights_version are never purged explicitly; they
// simply stop being requested and age out through LRU eviction.
class MatchCache {
public:
    explicit MatchCache(MatchCacheConfig cfg = {});

    // Hit promotes the entry to most recently used.
    std::optional<std::vector<MatchResult>> get(const CacheKey& key);
    void put(const CacheKey& key, std::vector<MatchResult> results);
    void clear();

    size_t size() const;
    CacheStats stats() const;

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        CacheKey key;
        std::vector<MatchResult> results;
        Clock::time_point stored_at;
    };

    bool expired(const Entry& e, Clock::time_point now) const;

    MatchCacheConfig m_cfg;

    mutable std::mutex m_mu;
    std::list<Entry> m_lru;  // front = most recently used
    std::unordered_map<CacheKey, std::list<Entry>::iterator, CacheKeyHash> m_index;
    CacheStats m_stats;
};

}  // namespace talentmatch

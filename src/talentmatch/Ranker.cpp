#include "talentmatch/Ranker.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <sstream>
#include <thread>

#include "talentmatch/GeoScorer.hpp"
#include "talentmatch/TenantGuard.hpp"
#include "text/TextUtil.hpp"

namespace talentmatch {

std::string canonical_query(const Entity& anchor, const RankQuery& q) {
    std::ostringstream oss;
    oss.precision(12);
    oss << "anchor=" << kind_str(anchor.kind) << ":" << anchor.id << "@" << anchor.updated_at
        << ";top_k=" << q.top_k
        << ";city_filter=" << (q.city_filter ? 1 : 0)
        << ";max_km=";
    if (q.max_distance_km) oss << *q.max_distance_km;
    else oss << "none";
    oss << ";breakdown=" << (q.include_breakdown ? 1 : 0)
        << ";drop_zero=" << (q.drop_zero_scores ? 1 : 0);
    return oss.str();
}

enum class SlotState : unsigned char {
    Pending,
    Filtered,
    Zero,
    Scored
};

using Clock = std::chrono::steady_clock;

static bool passes_prefilters(const Entity& anchor, const Entity& m, const RankQuery& q, const WeightConfiguration& w) {
    // different known cities: hard skip only when distance cannot pull the member back
    if (q.city_filter && !anchor.city.empty() && !m.city.empty() &&
        textutil::canonical_key(anchor.city) != textutil::canonical_key(m.city)) {
        if (w.distance <= 0.0) return false;
    }

    if (q.max_distance_km) {
        const auto d = distance_km(anchor.location, m.location);
        if (d && *d > *q.max_distance_km) return false;
    }

    return true;
}

Ranking rank_pool(const Entity& anchor, const std::vector<Entity>& pool, const RankQuery& q,
                  const WeightConfiguration& w, const RankLimits& limits) {
    require_tenant(anchor);

    Ranking out;

    TenantFilter admitted = admit_same_tenant(anchor, pool);
    out.rejected_tenant = admitted.rejected;

    std::vector<const Entity*> members;
    members.reserve(admitted.admitted.size());
    for (const Entity* e : admitted.admitted) {
        if (e->kind == anchor.kind) {
            ++out.skipped_kind;
            continue;
        }
        members.push_back(e);
    }

    if (limits.max_pool_size > 0 && members.size() > limits.max_pool_size) {
        out.capped = members.size() - limits.max_pool_size;
        members.resize(limits.max_pool_size);
    }

    const size_t n = members.size();
    std::vector<MatchResult> slots(n);
    std::vector<SlotState> states(n, SlotState::Pending);

    const bool bounded = limits.time_budget.count() > 0;
    const Clock::time_point deadline = Clock::now() + limits.time_budget;
    std::atomic<bool> stop{false};
    std::atomic<bool> out_of_time{false};

    auto run = [&](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) {
            if (stop.load(std::memory_order_relaxed)) return;
            if (bounded && Clock::now() > deadline) {
                out_of_time.store(true);
                stop.store(true);
                return;
            }

            const Entity& m = *members[i];
            if (!passes_prefilters(anchor, m, q, w)) {
                states[i] = SlotState::Filtered;
                continue;
            }

            slots[i] = score_pair(anchor, m, w, q.include_breakdown);
            states[i] = (q.drop_zero_scores && slots[i].score <= 0.0) ? SlotState::Zero : SlotState::Scored;
        }
    };

    const unsigned workers = static_cast<unsigned>(
        std::max<size_t>(1, std::min<size_t>(limits.parallelism, n)));

    if (workers <= 1) {
        run(0, n);
    } else {
        const size_t chunk = (n + workers - 1) / workers;
        std::vector<std::exception_ptr> errors(workers);
        std::vector<std::thread> threads;
        threads.reserve(workers);

        try {
            for (unsigned t = 0; t < workers; ++t) {
                const size_t begin = std::min(n, t * chunk);
                const size_t end = std::min(n, begin + chunk);
                threads.emplace_back([&, t, begin, end] {
                    try {
                        run(begin, end);
                    } catch (...) {
                        errors[t] = std::current_exception();
                        stop.store(true);
                    }
                });
            }
        } catch (...) {
            // thread creation failed: stop and join the workers already running
            stop.store(true);
            for (auto& th : threads) th.join();
            throw;
        }
        for (auto& th : threads) th.join();

        for (const auto& err : errors) {
            if (err) std::rethrow_exception(err);
        }
    }

    out.truncated = out_of_time.load();

    for (size_t i = 0; i < n; ++i) {
        switch (states[i]) {
            case SlotState::Filtered:
                ++out.filtered;
                break;
            case SlotState::Zero:
                ++out.scored;
                ++out.dropped_zero;
                break;
            case SlotState::Scored:
                ++out.scored;
                out.results.push_back(std::move(slots[i]));
                break;
            case SlotState::Pending:
                break;
        }
    }

    sort_results(out.results, limits.tie_epsilon);
    if (q.top_k > 0 && out.results.size() > q.top_k) out.results.resize(q.top_k);

    return out;
}

MatchResult explain_pair(const Entity& anchor, const Entity& counterpart, const WeightConfiguration& w) {
    require_same_tenant(anchor, counterpart);
    return score_pair(anchor, counterpart, w, true);
}

}  // namespace talentmatch

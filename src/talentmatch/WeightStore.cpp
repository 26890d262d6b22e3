#include "talentmatch/WeightStore.hpp"

#include <atomic>
#include <iostream>

namespace talentmatch {

static void log_warnings(const WeightConfiguration& w) {
    for (const auto& msg : weight_warnings(w)) {
        std::cerr << "WeightStore: warning: " << msg << " (version " << w.version << ")\n";
    }
}

WeightStore::WeightStore(const WeightConfiguration& initial) {
    auto issues = validate_weights(initial);
    if (!issues.empty()) {
        throw ConfigError(ValidationError(std::move(issues)).what());
    }

    WeightConfiguration first = initial;
    first.version = 1;
    log_warnings(first);
    std::atomic_store(&m_current, WeightSnapshot(std::make_shared<const WeightConfiguration>(first)));
}

WeightSnapshot WeightStore::snapshot() const {
    return std::atomic_load(&m_current);
}

std::uint64_t WeightStore::version() const {
    return snapshot()->version;
}

WeightSnapshot WeightStore::install_locked(WeightConfiguration next) {
    auto issues = validate_weights(next);
    if (!issues.empty()) throw ValidationError(std::move(issues));

    next.version = std::atomic_load(&m_current)->version + 1;
    log_warnings(next);

    auto snap = WeightSnapshot(std::make_shared<const WeightConfiguration>(next));
    std::atomic_store(&m_current, snap);
    return snap;
}

WeightSnapshot WeightStore::update(const WeightUpdate& u) {
    std::lock_guard<std::mutex> lock(m_write_mu);
    const WeightSnapshot cur = std::atomic_load(&m_current);
    return install_locked(apply_update(*cur, u));
}

WeightSnapshot WeightStore::replace(const WeightConfiguration& w) {
    std::lock_guard<std::mutex> lock(m_write_mu);
    return install_locked(w);
}

}  // namespace talentmatch

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>

#include "talentmatch/WeightConfig.hpp"

namespace talentmatch {

using WeightSnapshot = std::shared_ptr<const WeightConfiguration>;

// Process-wide weights. Readers take a snapshot without locking and keep using
// it for the whole call; writers install a new snapshot and never touch an old one.
class WeightStore {
public:
    // Throws ConfigError when `initial` does not validate.
    explicit WeightStore(const WeightConfiguration& initial = {});

    WeightSnapshot snapshot() const;
    std::uint64_t version() const;

    // Throws ValidationError and leaves the store unchanged on bad input.
    WeightSnapshot update(const WeightUpdate& u);
    WeightSnapshot replace(const WeightConfiguration& w);

private:
    WeightSnapshot install_locked(WeightConfiguration next);

    std::mutex m_write_mu;
    WeightSnapshot m_current;  // accessed through std::atomic_load / std::atomic_store
};

}  // namespace talentmatch

#pragma once

#include <optional>

#include "talentmatch/Models.hpp"

namespace talentmatch {

struct GeoDecay {
    double full_score_km = 5.0;   // score 1.0 at or below
    double zero_score_km = 150.0; // score 0.0 at or beyond
};

bool is_valid(const GeoPoint& p);

// Great-circle distance in km. nullopt when either point is absent or out of range.
std::optional<double> distance_km(const std::optional<GeoPoint>& a, const std::optional<GeoPoint>& b);

// Piecewise-linear decay of a distance into [0,1].
double distance_score(double km, const GeoDecay& decay = {});

}  // namespace talentmatch

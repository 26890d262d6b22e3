#include "talentmatch/GeoScorer.hpp"

#include <algorithm>
#include <cmath>

namespace talentmatch {

static constexpr double kEarthRadiusKm = 6371.2;
static constexpr double kPi = 3.14159265358979323846;

static double radians(double deg) {
    return deg * kPi / 180.0;
}

bool is_valid(const GeoPoint& p) {
    return std::isfinite(p.lat) && std::isfinite(p.lon) &&
           p.lat >= -90.0 && p.lat <= 90.0 &&
           p.lon >= -180.0 && p.lon <= 180.0;
}

std::optional<double> distance_km(const std::optional<GeoPoint>& a, const std::optional<GeoPoint>& b) {
    if (!a || !b) return std::nullopt;
    if (!is_valid(*a) || !is_valid(*b)) return std::nullopt;

    const double dlat = radians(b->lat - a->lat);
    const double dlon = radians(b->lon - a->lon);
    const double lat1 = radians(a->lat);
    const double lat2 = radians(b->lat);

    const double h = std::sin(dlat / 2) * std::sin(dlat / 2) +
                     std::cos(lat1) * std::cos(lat2) * std::sin(dlon / 2) * std::sin(dlon / 2);
    const double c = 2.0 * std::asin(std::min(1.0, std::sqrt(h)));
    return kEarthRadiusKm * c;
}

double distance_score(double km, const GeoDecay& decay) {
    if (!std::isfinite(km)) return 0.0;
    if (km <= decay.full_score_km) return 1.0;
    if (km >= decay.zero_score_km) return 0.0;

    const double span = decay.zero_score_km - decay.full_score_km;
    return std::max(0.0, 1.0 - (km - decay.full_score_km) / span);
}

}  // namespace talentmatch

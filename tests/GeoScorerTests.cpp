#include <gtest/gtest.h>

#include "talentmatch/GeoScorer.hpp"

using namespace talentmatch;

TEST(GeoScorerTest, DecayBreakpoints) {
    EXPECT_DOUBLE_EQ(distance_score(0.0), 1.0);
    EXPECT_DOUBLE_EQ(distance_score(5.0), 1.0);
    EXPECT_NEAR(distance_score(77.5), 0.5, 1e-12);
    EXPECT_DOUBLE_EQ(distance_score(150.0), 0.0);
    EXPECT_DOUBLE_EQ(distance_score(900.0), 0.0);
}

TEST(GeoScorerTest, DecayIsMonotonic) {
    double prev = 1.0;
    for (double km = 0.0; km <= 200.0; km += 2.5) {
        const double s = distance_score(km);
        EXPECT_LE(s, prev);
        EXPECT_GE(s, 0.0);
        prev = s;
    }
}

TEST(GeoScorerTest, HaversineBerlinMunich) {
    const auto d = distance_km(GeoPoint{52.5200, 13.4050}, GeoPoint{48.1372, 11.5755});
    ASSERT_TRUE(d.has_value());
    EXPECT_GT(*d, 495.0);
    EXPECT_LT(*d, 510.0);
}

TEST(GeoScorerTest, SamePointIsZeroKm) {
    const auto d = distance_km(GeoPoint{40.0, -3.7}, GeoPoint{40.0, -3.7});
    ASSERT_TRUE(d.has_value());
    EXPECT_NEAR(*d, 0.0, 1e-9);
}

TEST(GeoScorerTest, MissingOrInvalidCoordinatesAreAbsent) {
    EXPECT_FALSE(distance_km(std::nullopt, GeoPoint{1.0, 1.0}).has_value());
    EXPECT_FALSE(distance_km(GeoPoint{1.0, 1.0}, std::nullopt).has_value());
    EXPECT_FALSE(distance_km(GeoPoint{95.0, 0.0}, GeoPoint{1.0, 1.0}).has_value());
    EXPECT_FALSE(distance_km(GeoPoint{0.0, 181.0}, GeoPoint{1.0, 1.0}).has_value());
}

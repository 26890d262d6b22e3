#include <gtest/gtest.h>

#include "TestEntities.hpp"
#include "talentmatch/Errors.hpp"
#include "talentmatch/Ranker.hpp"

using namespace talentmatch;
using namespace testdata;

static std::vector<std::string> ids(const std::vector<MatchResult>& results) {
    std::vector<std::string> out;
    for (const auto& r : results) out.push_back(r.counterpart_id);
    return out;
}

TEST(RankerTest, OrdersByScoreThenId) {
    const Entity c = candidate("c1", {must("python"), needed("sql"), needed("docker")});
    const std::vector<Entity> pool = {
        job("j-low", {needed("sql")}),
        job("j-b", {must("python"), needed("sql"), needed("docker")}),
        job("j-a", {must("python"), needed("sql"), needed("docker")}),
        job("j-mid", {must("python"), needed("excel")}),
    };

    RankQuery q;
    q.top_k = 10;
    const Ranking r = rank_pool(c, pool, q, skill_title_weights());

    EXPECT_EQ(ids(r.results), (std::vector<std::string>{"j-a", "j-b", "j-mid", "j-low"}));
    EXPECT_EQ(r.scored, 4u);
    EXPECT_FALSE(r.truncated);
}

TEST(RankerTest, TopKTruncates) {
    const Entity c = candidate("c1", {must("python")});
    std::vector<Entity> pool;
    for (int i = 0; i < 8; ++i) pool.push_back(job("j" + std::to_string(i), {must("python")}));

    RankQuery q;
    q.top_k = 3;
    const Ranking r = rank_pool(c, pool, q, skill_title_weights());
    EXPECT_EQ(ids(r.results), (std::vector<std::string>{"j0", "j1", "j2"}));

    q.top_k = 0;
    EXPECT_EQ(rank_pool(c, pool, q, skill_title_weights()).results.size(), 8u);
}

TEST(RankerTest, CrossTenantMembersNeverAppear) {
    const Entity c = candidate("c1", {must("python"), needed("sql")}, "acme");
    const std::vector<Entity> pool = {
        job("perfect-elsewhere", {must("python"), needed("sql")}, "globex"),
        job("weak-here", {needed("sql")}, "acme"),
    };

    RankQuery q;
    const Ranking r = rank_pool(c, pool, q, skill_title_weights());
    EXPECT_EQ(ids(r.results), (std::vector<std::string>{"weak-here"}));
    EXPECT_EQ(r.rejected_tenant, 1u);
}

TEST(RankerTest, AnchorWithoutTenantThrows) {
    const Entity c = candidate("c1", {must("python")}, "");
    EXPECT_THROW(rank_pool(c, {job("j1", {must("python")}, "")}, RankQuery{}, WeightConfiguration{}), NotFound);
}

TEST(RankerTest, SameKindMembersAreSkipped) {
    const Entity c = candidate("c1", {must("python")});
    const std::vector<Entity> pool = {candidate("c2", {must("python")}), job("j1", {must("python")})};

    const Ranking r = rank_pool(c, pool, RankQuery{}, skill_title_weights());
    EXPECT_EQ(ids(r.results), (std::vector<std::string>{"j1"}));
    EXPECT_EQ(r.skipped_kind, 1u);
}

TEST(RankerTest, ZeroScoresDroppedUnlessRequested) {
    const Entity c = candidate("c1", {must("python")});
    const std::vector<Entity> pool = {job("j1", {must("rust")}), job("j2", {must("python")})};

    RankQuery q;
    Ranking r = rank_pool(c, pool, q, skill_title_weights());
    EXPECT_EQ(ids(r.results), (std::vector<std::string>{"j2"}));
    EXPECT_EQ(r.dropped_zero, 1u);

    q.drop_zero_scores = false;
    r = rank_pool(c, pool, q, skill_title_weights());
    EXPECT_EQ(ids(r.results), (std::vector<std::string>{"j2", "j1"}));
}

TEST(RankerTest, CityFilterIsStrictOnlyWithoutDistanceWeight) {
    Entity c = candidate("c1", {must("python")});
    c.city = "berlin";
    Entity far = job("j-munich", {must("python")});
    far.city = "munich";
    Entity near = job("j-berlin", {must("python")});
    near.city = "Berlin";
    Entity unknown = job("j-unknown", {must("python")});

    const std::vector<Entity> pool = {far, near, unknown};
    RankQuery q;
    q.top_k = 10;

    WeightConfiguration strict = skill_title_weights();
    strict.distance = 0.0;
    Ranking r = rank_pool(c, pool, q, strict);
    EXPECT_EQ(ids(r.results), (std::vector<std::string>{"j-berlin", "j-unknown"}));
    EXPECT_EQ(r.filtered, 1u);

    WeightConfiguration soft = skill_title_weights();
    soft.distance = 0.35;
    r = rank_pool(c, pool, q, soft);
    EXPECT_EQ(r.results.size(), 3u);

    q.city_filter = false;
    r = rank_pool(c, pool, q, strict);
    EXPECT_EQ(r.results.size(), 3u);
}

TEST(RankerTest, MaxDistanceSkipsFarMembersOnly) {
    Entity c = candidate("c1", {must("python")});
    c.location = GeoPoint{52.52, 13.405};       // Berlin
    Entity potsdam = job("j-potsdam", {must("python")});
    potsdam.location = GeoPoint{52.39, 13.06};
    Entity munich = job("j-munich", {must("python")});
    munich.location = GeoPoint{48.137, 11.575};
    Entity nowhere = job("j-nowhere", {must("python")});

    RankQuery q;
    q.top_k = 10;
    q.max_distance_km = 50.0;

    const Ranking r = rank_pool(c, {potsdam, munich, nowhere}, q, WeightConfiguration{});
    EXPECT_EQ(r.results.size(), 2u);
    for (const auto& m : r.results) EXPECT_NE(m.counterpart_id, "j-munich");
}

TEST(RankerTest, PoolIsCappedAtMaxPoolSize) {
    const Entity c = candidate("c1", {must("python")});
    std::vector<Entity> pool;
    for (int i = 0; i < 10; ++i) pool.push_back(job("j" + std::to_string(i), {must("python")}));

    RankLimits limits;
    limits.max_pool_size = 4;
    RankQuery q;
    q.top_k = 0;

    const Ranking r = rank_pool(c, pool, q, skill_title_weights(), limits);
    EXPECT_EQ(r.results.size(), 4u);
    EXPECT_EQ(r.capped, 6u);
}

TEST(RankerTest, ParallelRankingMatchesSequential) {
    const Entity c = candidate("c1", {must("python"), must("sql"), needed("docker"), needed("aws")});
    const char* skills[] = {"python", "sql", "docker", "aws", "excel", "rust"};

    std::vector<Entity> pool;
    for (int i = 0; i < 60; ++i) {
        std::vector<SkillRef> s;
        for (int k = 0; k < 6; ++k) {
            if ((i >> k) & 1) s.push_back(k < 2 ? must(skills[k]) : needed(skills[k]));
        }
        Entity j = job("j" + std::to_string(100 + i), s);
        j.title = (i % 3 == 0) ? "Data Engineer" : "Backend Developer";
        pool.push_back(j);
    }

    Entity anchor = c;
    anchor.title = "Data Engineer";

    RankQuery q;
    q.top_k = 0;
    q.include_breakdown = true;

    RankLimits seq;
    RankLimits par;
    par.parallelism = 4;

    const Ranking a = rank_pool(anchor, pool, q, skill_title_weights(), seq);
    const Ranking b = rank_pool(anchor, pool, q, skill_title_weights(), par);

    ASSERT_EQ(a.results.size(), b.results.size());
    for (size_t i = 0; i < a.results.size(); ++i) {
        EXPECT_EQ(a.results[i].counterpart_id, b.results[i].counterpart_id);
        EXPECT_DOUBLE_EQ(a.results[i].score, b.results[i].score);
    }
    EXPECT_EQ(a.dropped_zero, b.dropped_zero);
}

TEST(RankerTest, TimeBudgetTruncatesLargePool) {
    Entity c = candidate("c1", {must("python"), needed("sql"), needed("docker")});
    c.title = "Senior Data Engineer";
    c.text_blob = "python data pipelines warehouse modelling";

    Entity proto = job("j", {must("python"), needed("sql"), needed("airflow")});
    proto.title = "Data Platform Engineer";
    proto.text_blob = "data pipelines python airflow warehouse";
    const std::vector<Entity> pool(50000, proto);

    RankLimits limits;
    limits.max_pool_size = 0;
    limits.time_budget = std::chrono::milliseconds(1);

    RankQuery q;
    q.top_k = 0;
    const Ranking r = rank_pool(c, pool, q, WeightConfiguration{}, limits);

    EXPECT_TRUE(r.truncated);
    EXPECT_LT(r.scored, pool.size());
    EXPECT_EQ(r.results.size(), r.scored - r.dropped_zero);
}

TEST(RankerTest, CanonicalQueryReflectsEveryToggle) {
    Entity c = candidate("c1", {});
    RankQuery q;
    const std::string base = canonical_query(c, q);

    RankQuery q2 = q;
    q2.top_k = 9;
    EXPECT_NE(canonical_query(c, q2), base);

    q2 = q;
    q2.city_filter = false;
    EXPECT_NE(canonical_query(c, q2), base);

    q2 = q;
    q2.max_distance_km = 30.0;
    EXPECT_NE(canonical_query(c, q2), base);

    q2 = q;
    q2.include_breakdown = true;
    EXPECT_NE(canonical_query(c, q2), base);

    Entity touched = c;
    touched.updated_at = 1700000000;
    EXPECT_NE(canonical_query(touched, q), base);

    EXPECT_EQ(canonical_query(c, q), base);
}

TEST(RankerTest, ExplainPairRefusesCrossTenant) {
    const Entity c = candidate("c1", {must("python")}, "acme");
    const Entity j = job("j1", {must("python")}, "globex");
    EXPECT_THROW(explain_pair(c, j, WeightConfiguration{}), TenantMismatch);

    const MatchResult r = explain_pair(c, job("j2", {must("python")}, "acme"), WeightConfiguration{});
    EXPECT_TRUE(r.breakdown.has_value());
}

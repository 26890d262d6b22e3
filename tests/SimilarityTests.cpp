#include <gtest/gtest.h>

#include "talentmatch/Similarity.hpp"

using namespace talentmatch;

TEST(SimilarityTest, IdenticalTitlesScoreOne) {
    const auto s = title_similarity("Data Engineer", "data engineer");
    ASSERT_TRUE(s.has_value());
    EXPECT_DOUBLE_EQ(*s, 1.0);
}

TEST(SimilarityTest, ReorderedTitleScoresHigh) {
    const auto s = title_similarity("Senior Developer", "Developer, Senior");
    ASSERT_TRUE(s.has_value());
    EXPECT_GE(*s, 0.95);
}

TEST(SimilarityTest, TitleIsSymmetricAndBounded) {
    const auto ab = title_similarity("Backend Engineer (Go)", "Go Developer");
    const auto ba = title_similarity("Go Developer", "Backend Engineer (Go)");
    ASSERT_TRUE(ab.has_value());
    ASSERT_TRUE(ba.has_value());
    EXPECT_NEAR(*ab, *ba, 1e-9);
    EXPECT_GE(*ab, 0.0);
    EXPECT_LE(*ab, 1.0);
}

TEST(SimilarityTest, EmptyTitleIsAbsent) {
    EXPECT_FALSE(title_similarity("", "Engineer").has_value());
    EXPECT_FALSE(title_similarity("Engineer", " -- ").has_value());
}

TEST(SimilarityTest, SemanticOverlapOfContentTokens) {
    const auto s = semantic_similarity("python developer with sql", "sql python engineer");
    ASSERT_TRUE(s.has_value());
    EXPECT_NEAR(*s, 2.0 / 3.0, 1e-12);

    EXPECT_FALSE(semantic_similarity("", "python").has_value());
    EXPECT_FALSE(semantic_similarity("the and for", "python").has_value());
}

TEST(SimilarityTest, EmbeddingMapsCosineToUnitRange) {
    const std::optional<std::vector<float>> x = std::vector<float>{1.0f, 0.0f};
    const std::optional<std::vector<float>> y = std::vector<float>{0.0f, 1.0f};
    const std::optional<std::vector<float>> neg = std::vector<float>{-1.0f, 0.0f};

    EXPECT_NEAR(*embedding_similarity(x, x), 1.0, 1e-9);
    EXPECT_NEAR(*embedding_similarity(x, y), 0.5, 1e-9);
    EXPECT_NEAR(*embedding_similarity(x, neg), 0.0, 1e-9);
}

TEST(SimilarityTest, EmbeddingAbsentOnMissingMismatchedOrZero) {
    const std::optional<std::vector<float>> x = std::vector<float>{1.0f, 2.0f};
    const std::optional<std::vector<float>> three = std::vector<float>{1.0f, 2.0f, 3.0f};
    const std::optional<std::vector<float>> zero = std::vector<float>{0.0f, 0.0f};
    const std::optional<std::vector<float>> empty = std::vector<float>{};

    EXPECT_FALSE(embedding_similarity(x, std::nullopt).has_value());
    EXPECT_FALSE(embedding_similarity(x, three).has_value());
    EXPECT_FALSE(embedding_similarity(x, zero).has_value());
    EXPECT_FALSE(embedding_similarity(empty, empty).has_value());
}

#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>
#include <vector>

#include <score_normalizer/score_normalizer.hpp>

using wallet_scoring::NormalizeScores;

TEST(ScoreNormalizer, SpreadsDistinctScoresOverFullRange) {
    EXPECT_EQ(NormalizeScores({10.0, 50.0, 90.0}), (std::vector<int>{0, 500, 1000}));
    EXPECT_EQ(NormalizeScores({90.0, 10.0, 50.0}), (std::vector<int>{1000, 0, 500}));
}

TEST(ScoreNormalizer, DependsOnRankNotMagnitude) {
    EXPECT_EQ(NormalizeScores({-1e9, 0.5, 1e9}), NormalizeScores({1.0, 2.0, 3.0}));
}

TEST(ScoreNormalizer, RoundsHalfUp) {
    std::vector<double> scores;
    for (int i = 0; i < 17; ++i) {
        scores.push_back(static_cast<double>(i));
    }
    const auto normalized = NormalizeScores(scores);

    // rank 1 of 16 is 62.5, rank 3 is 187.5.
    EXPECT_EQ(normalized[1], 63);
    EXPECT_EQ(normalized[3], 188);
    EXPECT_EQ(normalized[8], 500);
    EXPECT_EQ(normalized.front(), 0);
    EXPECT_EQ(normalized.back(), 1000);
}

TEST(ScoreNormalizer, TiesShareTheirMidRank) {
    EXPECT_EQ(NormalizeScores({1.0, 2.0, 2.0, 3.0}), (std::vector<int>{0, 500, 500, 1000}));
    EXPECT_EQ(NormalizeScores({7.0, 7.0, 7.0}), (std::vector<int>{500, 500, 500}));
}

TEST(ScoreNormalizer, IsMonotonic) {
    const std::vector<double> scores{5.0, -3.0, 12.5, 12.5, 0.0, 99.0, -40.0};
    const auto normalized = NormalizeScores(scores);
    for (std::size_t i = 0; i < scores.size(); ++i) {
        for (std::size_t j = 0; j < scores.size(); ++j) {
            if (scores[i] <= scores[j]) {
                EXPECT_LE(normalized[i], normalized[j]);
            }
        }
    }
}

TEST(ScoreNormalizer, SingleWalletMapsToMiddle) {
    EXPECT_EQ(NormalizeScores({-123.0}), std::vector<int>{500});
}

TEST(ScoreNormalizer, EmptyPopulation) {
    EXPECT_TRUE(NormalizeScores({}).empty());
}

TEST(ScoreNormalizer, RejectsNonFiniteScores) {
    EXPECT_THROW(NormalizeScores({1.0, std::numeric_limits<double>::quiet_NaN()}), std::invalid_argument);
    EXPECT_THROW(NormalizeScores({std::numeric_limits<double>::infinity()}), std::invalid_argument);
}

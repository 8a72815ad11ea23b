#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>

#include <userver/formats/yaml/serialize.hpp>

#include <heuristic_scorer/heuristic_scorer.hpp>

namespace {

using wallet_scoring::HeuristicScorer;
using wallet_scoring::HeuristicWeights;
using wallet_scoring::WalletFeatureVector;

}  // namespace

TEST(HeuristicScorer, NeutralWalletGetsBaseAndRepayReward) {
    const HeuristicScorer scorer{HeuristicWeights{}};
    EXPECT_DOUBLE_EQ(scorer.Score(WalletFeatureVector{}), 550.0);
}

TEST(HeuristicScorer, LiquidationPenaltyHasDiminishingIncrementsAndCap) {
    const HeuristicScorer scorer{HeuristicWeights{}};
    WalletFeatureVector f;

    f.liquidation_count = 1.0;
    EXPECT_DOUBLE_EQ(scorer.Score(f), 150.0);
    f.liquidation_count = 3.0;
    EXPECT_DOUBLE_EQ(scorer.Score(f), -250.0);
    f.liquidation_count = 15.0;
    EXPECT_DOUBLE_EQ(scorer.Score(f), -650.0);
    f.liquidation_count = 100.0;
    EXPECT_DOUBLE_EQ(scorer.Score(f), -650.0);
}

TEST(HeuristicScorer, MoreLiquidationsNeverScoreHigher) {
    const HeuristicScorer scorer{HeuristicWeights{}};
    WalletFeatureVector f;
    f.wallet_age_days = 200.0;
    f.unique_active_days = 40.0;
    f.asset_diversity = 3.0;
    f.net_deposit_usd = 50000.0;

    double previous = scorer.Score(f);
    for (int liquidations = 1; liquidations <= 20; ++liquidations) {
        f.liquidation_count = liquidations;
        const double current = scorer.Score(f);
        EXPECT_LE(current, previous) << liquidations << " liquidations";
        previous = current;
    }
}

TEST(HeuristicScorer, LowHealthFactorIsPenalized) {
    const HeuristicScorer scorer{HeuristicWeights{}};
    WalletFeatureVector f;
    f.borrow_count = 1.0;
    f.min_health_factor_proxy = 1.0;
    f.mean_health_factor_proxy = 1.0;
    f.repay_to_borrow_ratio = 0.0;

    EXPECT_DOUBLE_EQ(scorer.Score(f), 460.0);
}

TEST(HeuristicScorer, BotLikeFrequencyIsPenalized) {
    const HeuristicScorer scorer{HeuristicWeights{}};
    WalletFeatureVector f;
    f.transaction_frequency = 12.0;
    EXPECT_DOUBLE_EQ(scorer.Score(f), 540.0);
    f.transaction_frequency = 500.0;
    EXPECT_DOUBLE_EQ(scorer.Score(f), 450.0);
}

TEST(HeuristicScorer, RewardsAreCapped) {
    const HeuristicScorer scorer{HeuristicWeights{}};
    WalletFeatureVector f;
    f.wallet_age_days = 10000.0;
    f.unique_active_days = 10000.0;
    f.asset_diversity = 100.0;
    f.net_deposit_usd = 1e30;
    f.repay_to_borrow_ratio = 5.0;

    EXPECT_DOUBLE_EQ(scorer.Score(f), 500.0 + 75.0 + 50.0 + 75.0 + 50.0 + 25.0);
}

TEST(HeuristicScorer, ScoreAllKeepsOrder) {
    const HeuristicScorer scorer{HeuristicWeights{}};
    WalletFeatureVector liquidated;
    liquidated.liquidation_count = 1.0;

    const auto scores = scorer.ScoreAll({WalletFeatureVector{}, liquidated});
    ASSERT_EQ(scores.size(), 2u);
    EXPECT_DOUBLE_EQ(scores[0], 550.0);
    EXPECT_DOUBLE_EQ(scores[1], 150.0);
}

TEST(HeuristicWeights, ParsesKebabCaseKeysWithDefaults) {
    const auto weights = userver::formats::yaml::FromString(R"(
base-score: 600
liquidation-penalty-cap: 800
)").As<HeuristicWeights>();

    const HeuristicWeights defaults;
    EXPECT_DOUBLE_EQ(weights.base_score, 600.0);
    EXPECT_DOUBLE_EQ(weights.liquidation_penalty_cap, 800.0);
    EXPECT_DOUBLE_EQ(weights.liquidation_penalty, defaults.liquidation_penalty);
    EXPECT_DOUBLE_EQ(weights.diversity_reward_cap, defaults.diversity_reward_cap);
}

TEST(HeuristicWeights, InvalidWeightsAreRejected) {
    HeuristicWeights negative_cap;
    negative_cap.age_reward_cap = -1.0;
    EXPECT_THROW(HeuristicScorer{negative_cap}, std::invalid_argument);

    HeuristicWeights not_finite;
    not_finite.base_score = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(wallet_scoring::ValidateWeights(not_finite), std::invalid_argument);
}

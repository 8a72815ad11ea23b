#pragma once

#include <string>

#include <userver/formats/parse/to.hpp>

namespace wallet_scoring {

// Signed contributions of the heuristic model. Penalties are subtracted,
// rewards added; every unbounded feature has a cap.
struct HeuristicWeights {
    double base_score = 500.0;

    // Penalties
    double liquidation_penalty = 400.0;       // per log2(1 + liquidations)
    double liquidation_penalty_cap = 1200.0;
    double health_factor_floor = 1.5;
    double low_health_factor_penalty = 100.0;
    double leverage_penalty = 50.0;
    double leverage_penalty_cap = 150.0;
    double bot_frequency_threshold = 10.0;    // transactions per active day
    double bot_frequency_penalty = 5.0;
    double bot_frequency_penalty_cap = 100.0;

    // Rewards
    double age_reward = 0.3;                  // per day
    double age_reward_cap = 75.0;
    double health_factor_reward = 10.0;
    double health_factor_reward_ceiling = 10.0;
    double repay_reward = 50.0;
    double repay_reward_cap = 50.0;
    double liquidity_reward = 5.0;            // per log1p(net deposit USD)
    double liquidity_reward_cap = 75.0;
    double activity_reward = 1.0;             // per active day
    double activity_reward_cap = 50.0;
    double diversity_reward = 5.0;            // per distinct asset
    double diversity_reward_cap = 25.0;
};

// Throws std::invalid_argument on non-finite values or negative caps.
void ValidateWeights(const HeuristicWeights& weights);

// Reads a YAML document with the same keys as the static config
// `weights` section; absent keys keep their defaults.
HeuristicWeights LoadHeuristicWeights(const std::string& path);

template <typename Value>
HeuristicWeights Parse(const Value& value, userver::formats::parse::To<HeuristicWeights>) {
    const HeuristicWeights d;
    HeuristicWeights w;
    w.base_score = value["base-score"].template As<double>(d.base_score);
    w.liquidation_penalty = value["liquidation-penalty"].template As<double>(d.liquidation_penalty);
    w.liquidation_penalty_cap =
        value["liquidation-penalty-cap"].template As<double>(d.liquidation_penalty_cap);
    w.health_factor_floor = value["health-factor-floor"].template As<double>(d.health_factor_floor);
    w.low_health_factor_penalty =
        value["low-health-factor-penalty"].template As<double>(d.low_health_factor_penalty);
    w.leverage_penalty = value["leverage-penalty"].template As<double>(d.leverage_penalty);
    w.leverage_penalty_cap = value["leverage-penalty-cap"].template As<double>(d.leverage_penalty_cap);
    w.bot_frequency_threshold =
        value["bot-frequency-threshold"].template As<double>(d.bot_frequency_threshold);
    w.bot_frequency_penalty = value["bot-frequency-penalty"].template As<double>(d.bot_frequency_penalty);
    w.bot_frequency_penalty_cap =
        value["bot-frequency-penalty-cap"].template As<double>(d.bot_frequency_penalty_cap);
    w.age_reward = value["age-reward"].template As<double>(d.age_reward);
    w.age_reward_cap = value["age-reward-cap"].template As<double>(d.age_reward_cap);
    w.health_factor_reward = value["health-factor-reward"].template As<double>(d.health_factor_reward);
    w.health_factor_reward_ceiling =
        value["health-factor-reward-ceiling"].template As<double>(d.health_factor_reward_ceiling);
    w.repay_reward = value["repay-reward"].template As<double>(d.repay_reward);
    w.repay_reward_cap = value["repay-reward-cap"].template As<double>(d.repay_reward_cap);
    w.liquidity_reward = value["liquidity-reward"].template As<double>(d.liquidity_reward);
    w.liquidity_reward_cap = value["liquidity-reward-cap"].template As<double>(d.liquidity_reward_cap);
    w.activity_reward = value["activity-reward"].template As<double>(d.activity_reward);
    w.activity_reward_cap = value["activity-reward-cap"].template As<double>(d.activity_reward_cap);
    w.diversity_reward = value["diversity-reward"].template As<double>(d.diversity_reward);
    w.diversity_reward_cap = value["diversity-reward-cap"].template As<double>(d.diversity_reward_cap);
    return w;
}

}  // namespace wallet_scoring

#include "heuristic_scorer.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include <userver/formats/yaml/serialize.hpp>
#include <userver/formats/yaml/value.hpp>
#include <userver/logging/log.hpp>

namespace wallet_scoring {

namespace {

double Capped(double value, double cap) {
    return std::min(value, cap);
}

void RequireFinite(double value, const char* name) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument(fmt::format("heuristic weight '{}' is not finite", name));
    }
}

void RequireCap(double value, const char* name) {
    RequireFinite(value, name);
    if (value < 0.0) {
        throw std::invalid_argument(fmt::format("heuristic cap '{}' must be non-negative", name));
    }
}

}  // namespace

void ValidateWeights(const HeuristicWeights& w) {
    RequireFinite(w.base_score, "base-score");
    RequireFinite(w.liquidation_penalty, "liquidation-penalty");
    RequireCap(w.liquidation_penalty_cap, "liquidation-penalty-cap");
    RequireFinite(w.health_factor_floor, "health-factor-floor");
    RequireFinite(w.low_health_factor_penalty, "low-health-factor-penalty");
    RequireFinite(w.leverage_penalty, "leverage-penalty");
    RequireCap(w.leverage_penalty_cap, "leverage-penalty-cap");
    RequireFinite(w.bot_frequency_threshold, "bot-frequency-threshold");
    RequireFinite(w.bot_frequency_penalty, "bot-frequency-penalty");
    RequireCap(w.bot_frequency_penalty_cap, "bot-frequency-penalty-cap");
    RequireFinite(w.age_reward, "age-reward");
    RequireCap(w.age_reward_cap, "age-reward-cap");
    RequireFinite(w.health_factor_reward, "health-factor-reward");
    RequireCap(w.health_factor_reward_ceiling, "health-factor-reward-ceiling");
    RequireFinite(w.repay_reward, "repay-reward");
    RequireCap(w.repay_reward_cap, "repay-reward-cap");
    RequireFinite(w.liquidity_reward, "liquidity-reward");
    RequireCap(w.liquidity_reward_cap, "liquidity-reward-cap");
    RequireFinite(w.activity_reward, "activity-reward");
    RequireCap(w.activity_reward_cap, "activity-reward-cap");
    RequireFinite(w.diversity_reward, "diversity-reward");
    RequireCap(w.diversity_reward_cap, "diversity-reward-cap");
}

HeuristicWeights LoadHeuristicWeights(const std::string& path) {
    LOG_INFO() << "Loading heuristic weights from " << path;
    auto weights = userver::formats::yaml::blocking::FromFile(path).As<HeuristicWeights>();
    ValidateWeights(weights);
    return weights;
}

HeuristicScorer::HeuristicScorer(HeuristicWeights weights)
    : weights_(std::move(weights)) {
    ValidateWeights(weights_);
}

double HeuristicScorer::Score(const WalletFeatureVector& f) const {
    return weights_.base_score - Penalties(f) + Rewards(f);
}

std::vector<double> HeuristicScorer::ScoreAll(const std::vector<WalletFeatureVector>& population) const {
    std::vector<double> scores;
    scores.reserve(population.size());
    for (const auto& features : population) {
        scores.push_back(Score(features));
    }
    return scores;
}

double HeuristicScorer::Penalties(const WalletFeatureVector& f) const {
    const auto& w = weights_;
    double penalty = 0.0;

    // Liquidations dominate, with diminishing increments per extra event.
    penalty += Capped(w.liquidation_penalty * std::log2(1.0 + f.liquidation_count),
                      w.liquidation_penalty_cap);

    if (f.min_health_factor_proxy < w.health_factor_floor) {
        penalty += (w.health_factor_floor - f.min_health_factor_proxy) * w.low_health_factor_penalty;
    }

    penalty += Capped(f.borrow_to_deposit_ratio * w.leverage_penalty, w.leverage_penalty_cap);

    const double excess_frequency =
        std::max(f.transaction_frequency, w.bot_frequency_threshold) - w.bot_frequency_threshold;
    penalty += Capped(excess_frequency * w.bot_frequency_penalty, w.bot_frequency_penalty_cap);

    return penalty;
}

double HeuristicScorer::Rewards(const WalletFeatureVector& f) const {
    const auto& w = weights_;
    double reward = 0.0;

    reward += Capped(f.wallet_age_days * w.age_reward, w.age_reward_cap);

    // Non-borrowers carry the no-debt sentinel, which says nothing about debt management.
    if (f.borrow_count > 0.0) {
        reward += std::min(f.mean_health_factor_proxy, w.health_factor_reward_ceiling) *
                  w.health_factor_reward;
    }

    reward += Capped(f.repay_to_borrow_ratio * w.repay_reward, w.repay_reward_cap);
    reward += Capped(std::log1p(std::max(0.0, f.net_deposit_usd)) * w.liquidity_reward,
                     w.liquidity_reward_cap);
    reward += Capped(f.unique_active_days * w.activity_reward, w.activity_reward_cap);
    reward += Capped(f.asset_diversity * w.diversity_reward, w.diversity_reward_cap);

    return reward;
}

}  // namespace wallet_scoring

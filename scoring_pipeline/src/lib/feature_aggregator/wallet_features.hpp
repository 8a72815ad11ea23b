#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wallet_scoring {

// Health factor proxy for wallets that never carried debt. Also the cap
// applied to every observed sample.
inline constexpr double kNoDebtHealthFactor = 1000.0;

// repay_to_borrow_ratio of a wallet that never borrowed.
inline constexpr double kFullyRepaidRatio = 1.0;

// borrow_to_deposit_ratio cap, also used for borrows without any deposit.
inline constexpr double kMaxBorrowToDepositRatio = 100.0;

inline constexpr int64_t kSecondsPerDay = 86400;

struct WalletFeatureVector {
    // Stability
    double wallet_age_days = 0.0;
    double total_transactions = 0.0;
    double unique_active_days = 0.0;
    double transaction_frequency = 0.0;

    // Activity
    double deposit_count = 0.0;
    double borrow_count = 0.0;
    double repay_count = 0.0;
    double redeem_count = 0.0;
    double liquidation_count = 0.0;
    double asset_diversity = 0.0;

    // Financial health, USD
    double total_deposit_usd = 0.0;
    double total_borrow_usd = 0.0;
    double total_repay_usd = 0.0;
    double total_redeem_usd = 0.0;
    double total_liquidation_usd = 0.0;
    double average_transaction_value_usd = 0.0;
    double net_deposit_usd = 0.0;

    // Risk
    double min_health_factor_proxy = kNoDebtHealthFactor;
    double mean_health_factor_proxy = kNoDebtHealthFactor;
    double repay_to_borrow_ratio = kFullyRepaidRatio;
    double borrow_to_deposit_ratio = 0.0;
};

using FeatureTable = std::map<std::string, WalletFeatureVector>;

// Column order used by the feature matrix export and the tests.
std::vector<std::pair<std::string_view, double>> FeatureColumns(const WalletFeatureVector& features);

}  // namespace wallet_scoring

#include "feature_aggregator.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <unordered_set>

#include <fmt/format.h>

#include <userver/logging/log.hpp>

namespace wallet_scoring {

namespace {

// Debt below this is treated as fully repaid dust.
constexpr double kDebtEpsilonUsd = 1e-9;

int64_t DayIndex(int64_t timestamp) {
    return timestamp >= 0 ? timestamp / kSecondsPerDay
                          : (timestamp - (kSecondsPerDay - 1)) / kSecondsPerDay;
}

}  // namespace

std::vector<std::pair<std::string_view, double>> FeatureColumns(const WalletFeatureVector& f) {
    return {
        {"wallet_age_days", f.wallet_age_days},
        {"total_transactions", f.total_transactions},
        {"unique_active_days", f.unique_active_days},
        {"transaction_frequency", f.transaction_frequency},
        {"deposit_count", f.deposit_count},
        {"borrow_count", f.borrow_count},
        {"repay_count", f.repay_count},
        {"redeem_count", f.redeem_count},
        {"liquidation_count", f.liquidation_count},
        {"asset_diversity", f.asset_diversity},
        {"total_deposit_usd", f.total_deposit_usd},
        {"total_borrow_usd", f.total_borrow_usd},
        {"total_repay_usd", f.total_repay_usd},
        {"total_redeem_usd", f.total_redeem_usd},
        {"total_liquidation_usd", f.total_liquidation_usd},
        {"average_transaction_value_usd", f.average_transaction_value_usd},
        {"net_deposit_usd", f.net_deposit_usd},
        {"min_health_factor_proxy", f.min_health_factor_proxy},
        {"mean_health_factor_proxy", f.mean_health_factor_proxy},
        {"repay_to_borrow_ratio", f.repay_to_borrow_ratio},
        {"borrow_to_deposit_ratio", f.borrow_to_deposit_ratio},
    };
}

WalletFeatureVector FeatureAggregator::Aggregate(const WalletTransactions& transactions) const {
    if (transactions.empty()) {
        throw std::invalid_argument("cannot aggregate features of a wallet without transactions");
    }

    WalletFeatureVector out;

    int64_t unique_days = 0;
    int64_t last_day = 0;
    double total_usd = 0.0;
    std::unordered_set<std::string> assets;

    // Running position used for the health factor proxy.
    double collateral = 0.0;
    double debt = 0.0;
    double hf_min = kNoDebtHealthFactor;
    double hf_sum = 0.0;
    int64_t hf_samples = 0;

    for (const auto& tx : transactions) {
        const double usd = tx.amount_usd();
        const int64_t day = DayIndex(tx.timestamp());
        if (unique_days == 0 || day != last_day) {
            ++unique_days;
            last_day = day;
        }
        out.total_transactions += 1.0;
        total_usd += usd;
        if (!tx.asset_symbol().empty()) {
            assets.insert(tx.asset_symbol());
        }

        switch (tx.action()) {
            case wallet::Transaction::DEPOSIT:
                out.deposit_count += 1.0;
                out.total_deposit_usd += usd;
                collateral += usd;
                break;
            case wallet::Transaction::BORROW:
                out.borrow_count += 1.0;
                out.total_borrow_usd += usd;
                debt += usd;
                break;
            case wallet::Transaction::REPAY:
                out.repay_count += 1.0;
                out.total_repay_usd += usd;
                debt = std::max(0.0, debt - usd);
                break;
            case wallet::Transaction::REDEEM_UNDERLYING:
                out.redeem_count += 1.0;
                out.total_redeem_usd += usd;
                collateral = std::max(0.0, collateral - usd);
                break;
            case wallet::Transaction::LIQUIDATION_CALL:
                out.liquidation_count += 1.0;
                out.total_liquidation_usd += usd;
                collateral = std::max(0.0, collateral - usd);
                break;
            default:
                break;
        }

        if (debt > kDebtEpsilonUsd) {
            const double hf = std::min(collateral / debt, kNoDebtHealthFactor);
            hf_min = std::min(hf_min, hf);
            hf_sum += hf;
            ++hf_samples;
        }
    }

    const int64_t first_ts = transactions.front().timestamp();
    const int64_t last_ts = transactions.back().timestamp();
    out.wallet_age_days = static_cast<double>(last_ts - first_ts) / static_cast<double>(kSecondsPerDay);
    out.unique_active_days = static_cast<double>(unique_days);
    out.transaction_frequency = out.total_transactions / out.unique_active_days;
    out.asset_diversity = static_cast<double>(assets.size());
    out.average_transaction_value_usd = total_usd / out.total_transactions;
    out.net_deposit_usd = out.total_deposit_usd - out.total_redeem_usd;

    if (hf_samples > 0) {
        out.min_health_factor_proxy = hf_min;
        out.mean_health_factor_proxy = hf_sum / static_cast<double>(hf_samples);
    }

    if (out.total_borrow_usd > 0.0) {
        out.repay_to_borrow_ratio = out.total_repay_usd / out.total_borrow_usd;
        out.borrow_to_deposit_ratio = out.total_deposit_usd > 0.0
            ? std::min(out.total_borrow_usd / out.total_deposit_usd, kMaxBorrowToDepositRatio)
            : kMaxBorrowToDepositRatio;
    } else if (out.borrow_count > 0.0) {
        // Borrowed, but without a known USD value.
        out.repay_to_borrow_ratio = out.repay_count > 0.0 ? kFullyRepaidRatio : 0.0;
    }

    for (const auto& [name, value] : FeatureColumns(out)) {
        if (!std::isfinite(value)) {
            throw std::invalid_argument(fmt::format("feature '{}' of wallet {} is not finite",
                                                    name, transactions.front().user_wallet()));
        }
    }
    return out;
}

FeatureTable FeatureAggregator::AggregateAll(const TransactionLog& log) const {
    FeatureTable table;
    for (const auto& [wallet, transactions] : log.by_wallet) {
        table.emplace(wallet, Aggregate(transactions));
    }
    LOG_INFO() << "Created " << FeatureColumns(WalletFeatureVector{}).size()
               << " features for " << table.size() << " wallets";
    return table;
}

}  // namespace wallet_scoring

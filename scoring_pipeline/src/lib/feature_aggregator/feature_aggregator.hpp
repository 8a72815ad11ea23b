#pragma once

#include "feature_aggregator/wallet_features.hpp"
#include "transaction_loader/transaction_loader.hpp"

namespace wallet_scoring {

class FeatureAggregator {
public:
    // Single forward scan over one wallet's time-ordered transactions.
    // Throws std::invalid_argument for an empty group.
    WalletFeatureVector Aggregate(const WalletTransactions& transactions) const;

    FeatureTable AggregateAll(const TransactionLog& log) const;
};

}  // namespace wallet_scoring

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <userver/formats/json/value.hpp>

#include <wallet/transaction.pb.h>

namespace wallet_scoring {

// The input as a whole cannot be read as a collection of records.
// Fatal for the run: nothing is scored or published.
class InputUnreadableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A single record failed validation. Never leaves the loader.
class MalformedRecordError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Larger USD values are rejected as malformed, so per-wallet sums stay finite.
inline constexpr double kMaxTransactionUsd = 1e15;

using WalletTransactions = std::vector<wallet::Transaction>;

struct TransactionLog {
    // Ordered by wallet address, each group ordered by timestamp ascending.
    std::map<std::string, WalletTransactions> by_wallet;
    std::size_t records_read = 0;
    std::size_t records_dropped = 0;

    std::size_t ProcessedCount() const { return records_read - records_dropped; }
    std::size_t WalletCount() const { return by_wallet.size(); }
};

class TransactionLoader {
public:
    // Reads a JSON array of raw protocol events (userWallet, action,
    // timestamp, actionData{amount, assetSymbol, assetPriceUSD, ...}).
    TransactionLog LoadFromFile(const std::string& path) const;
    TransactionLog LoadFromString(std::string_view json) const;
    TransactionLog Load(const userver::formats::json::Value& records) const;

    // Throws MalformedRecordError with the reason.
    static wallet::Transaction ParseRecord(const userver::formats::json::Value& record);

    static std::optional<wallet::Transaction::Action> ParseAction(std::string_view action);
    static std::optional<int64_t> ParseTimestamp(const userver::formats::json::Value& value);
    static std::optional<double> ParseNumber(const userver::formats::json::Value& value);
    static std::string NormalizeWallet(std::string_view wallet);
};

}  // namespace wallet_scoring

#include "transaction_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>
#include <system_error>

#include <fmt/format.h>

#include <userver/formats/json/exception.hpp>
#include <userver/formats/json/serialize.hpp>
#include <userver/fs/blocking/read.hpp>
#include <userver/logging/log.hpp>
#include <userver/utils/text_light.hpp>

namespace wallet_scoring {

namespace {

std::string Trim(std::string_view s) {
    return userver::utils::text::Trim(std::string(s));
}

std::string ToLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

constexpr std::string_view kForbiddenWalletChars = ",\"\r\n";

bool IsDigits(std::string_view s) {
    if (s.empty()) return false;
    size_t start = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if (start == s.size()) return false;
    return std::all_of(s.begin() + start, s.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

// "2021-04-27T21:30:00", optional fractional seconds and trailing 'Z'.
std::optional<int64_t> ParseIsoToEpochSeconds(const std::string& iso) {
    std::string core = iso.substr(0, iso.find_first_of(".Z"));
    std::tm tm{};
    std::istringstream ss(core);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }
    ss >> std::ws;
    if (!ss.eof()) {
        return std::nullopt;
    }
    return static_cast<int64_t>(timegm(&tm));
}

std::string RequireString(const userver::formats::json::Value& record, std::string_view field) {
    const auto value = record[std::string(field)];
    if (value.IsMissing() || value.IsNull()) {
        throw MalformedRecordError(fmt::format("missing field '{}'", field));
    }
    if (!value.IsString()) {
        throw MalformedRecordError(fmt::format("field '{}' is not a string", field));
    }
    return value.As<std::string>();
}

std::string OptionalString(const userver::formats::json::Value& record, std::string_view field) {
    const auto value = record[std::string(field)];
    if (value.IsString()) {
        return value.As<std::string>();
    }
    return {};
}

}  // namespace

TransactionLog TransactionLoader::LoadFromFile(const std::string& path) const {
    LOG_INFO() << "Loading transactions from " << path;
    std::string contents;
    try {
        contents = userver::fs::blocking::ReadFileContents(path);
    } catch (const std::exception& e) {
        throw InputUnreadableError(
            fmt::format("cannot read transaction log '{}': {}", path, e.what()));
    }
    return LoadFromString(contents);
}

TransactionLog TransactionLoader::LoadFromString(std::string_view json) const {
    userver::formats::json::Value records;
    try {
        records = userver::formats::json::FromString(json);
    } catch (const userver::formats::json::Exception& e) {
        throw InputUnreadableError(
            fmt::format("transaction log is not valid JSON: {}", e.what()));
    }
    return Load(records);
}

TransactionLog TransactionLoader::Load(const userver::formats::json::Value& records) const {
    if (!records.IsArray()) {
        throw InputUnreadableError("transaction log root is not an array of records");
    }

    TransactionLog log;
    size_t index = 0;
    for (const auto& record : records) {
        ++log.records_read;
        try {
            auto tx = ParseRecord(record);
            auto wallet = tx.user_wallet();
            log.by_wallet[wallet].push_back(std::move(tx));
        } catch (const MalformedRecordError& e) {
            ++log.records_dropped;
            LOG_WARNING() << fmt::format("Dropping malformed record #{}: {}", index, e.what());
        }
        ++index;
    }

    for (auto& [wallet, transactions] : log.by_wallet) {
        std::stable_sort(transactions.begin(), transactions.end(),
                         [](const wallet::Transaction& lhs, const wallet::Transaction& rhs) {
                             return lhs.timestamp() < rhs.timestamp();
                         });
    }

    LOG_INFO() << fmt::format(
        "Loaded {} transactions for {} wallets ({} records read, {} dropped)",
        log.ProcessedCount(), log.WalletCount(), log.records_read, log.records_dropped);
    return log;
}

wallet::Transaction TransactionLoader::ParseRecord(const userver::formats::json::Value& record) {
    if (!record.IsObject()) {
        throw MalformedRecordError("record is not an object");
    }

    wallet::Transaction tx;

    const auto wallet = NormalizeWallet(RequireString(record, "userWallet"));
    if (wallet.empty()) {
        throw MalformedRecordError("empty wallet address");
    }
    if (wallet.find_first_of(kForbiddenWalletChars) != std::string::npos) {
        throw MalformedRecordError(fmt::format("wallet address '{}' contains a separator or quote", wallet));
    }
    tx.set_user_wallet(wallet);

    const auto action_str = RequireString(record, "action");
    const auto action = ParseAction(action_str);
    if (!action) {
        throw MalformedRecordError(fmt::format("unknown action '{}'", action_str));
    }
    tx.set_action(*action);

    const auto timestamp = ParseTimestamp(record["timestamp"]);
    if (!timestamp) {
        throw MalformedRecordError("missing or unparseable timestamp");
    }
    tx.set_timestamp(*timestamp);

    const auto data = record["actionData"];
    if (!data.IsObject()) {
        throw MalformedRecordError("missing actionData");
    }

    auto amount_field = data["amount"];
    auto price_field = data["assetPriceUSD"];
    std::string asset = OptionalString(data, "assetSymbol");
    if (*action == wallet::Transaction::LIQUIDATION_CALL && amount_field.IsMissing()) {
        // Liquidation events carry the seized collateral instead of a plain amount.
        amount_field = data["collateralAmount"];
        price_field = data["collateralAssetPriceUSD"];
        if (asset.empty()) {
            asset = OptionalString(data, "collateralReserveSymbol");
        }
    }

    double amount = 0.0;
    if (!amount_field.IsMissing()) {
        const auto parsed = ParseNumber(amount_field);
        if (!parsed) {
            throw MalformedRecordError("unparseable amount");
        }
        amount = *parsed;
    } else if (*action != wallet::Transaction::LIQUIDATION_CALL) {
        throw MalformedRecordError("missing amount");
    }
    if (amount < 0.0) {
        throw MalformedRecordError("negative amount");
    }

    // Unknown prices value the event at zero instead of dropping it.
    const double price = ParseNumber(price_field).value_or(0.0);
    if (price < 0.0) {
        throw MalformedRecordError("negative asset price");
    }

    const double amount_usd = amount * price;
    if (!std::isfinite(amount_usd) || amount_usd > kMaxTransactionUsd) {
        throw MalformedRecordError(fmt::format("amount in USD {} is out of range", amount_usd));
    }

    tx.set_amount(amount);
    tx.set_asset_price_usd(price);
    tx.set_amount_usd(amount_usd);
    tx.set_asset_symbol(asset);
    tx.set_tx_hash(OptionalString(record, "txHash"));
    tx.set_protocol(OptionalString(record, "protocol"));
    tx.set_network(OptionalString(record, "network"));
    return tx;
}

std::optional<wallet::Transaction::Action> TransactionLoader::ParseAction(std::string_view action) {
    const auto lower = ToLower(Trim(action));
    if (lower == "deposit") return wallet::Transaction::DEPOSIT;
    if (lower == "borrow") return wallet::Transaction::BORROW;
    if (lower == "repay") return wallet::Transaction::REPAY;
    if (lower == "redeemunderlying" || lower == "redeem" || lower == "withdraw") {
        return wallet::Transaction::REDEEM_UNDERLYING;
    }
    if (lower == "liquidationcall" || lower == "liquidation") {
        return wallet::Transaction::LIQUIDATION_CALL;
    }
    return std::nullopt;
}

std::optional<int64_t> TransactionLoader::ParseTimestamp(const userver::formats::json::Value& value) {
    if (value.IsMissing() || value.IsNull()) {
        return std::nullopt;
    }
    if (value.IsInt64()) {
        return value.As<int64_t>();
    }
    if (value.IsDouble()) {
        const double ts = value.As<double>();
        // 2^63 is exactly representable, INT64_MAX is not.
        constexpr double kUpperBound = 9223372036854775808.0;
        const double floored = std::floor(ts);
        if (!std::isfinite(floored) ||
            floored < static_cast<double>(std::numeric_limits<int64_t>::min()) || floored >= kUpperBound) {
            return std::nullopt;
        }
        return static_cast<int64_t>(floored);
    }
    if (!value.IsString()) {
        return std::nullopt;
    }

    const auto t = Trim(value.As<std::string>());
    if (t.empty()) return std::nullopt;
    if (t.find('T') != std::string::npos) {
        return ParseIsoToEpochSeconds(t);
    }
    if (!IsDigits(t)) {
        return std::nullopt;
    }
    try {
        return std::stoll(t);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<double> TransactionLoader::ParseNumber(const userver::formats::json::Value& value) {
    double result = 0.0;
    if (value.IsInt64() || value.IsUInt64() || value.IsDouble()) {
        result = value.As<double>();
    } else if (value.IsString()) {
        const auto s = Trim(value.As<std::string>());
        if (s.empty()) return std::nullopt;
        try {
            size_t pos = 0;
            result = std::stod(s, &pos);
            if (pos != s.size()) return std::nullopt;
        } catch (const std::invalid_argument&) {
            return std::nullopt;
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    } else {
        return std::nullopt;
    }
    if (!std::isfinite(result)) {
        return std::nullopt;
    }
    return result;
}

std::string TransactionLoader::NormalizeWallet(std::string_view wallet) {
    return ToLower(Trim(wallet));
}

}  // namespace wallet_scoring

#include <gtest/gtest.h>

#include <userver/formats/json/serialize.hpp>

#include <transaction_loader/transaction_loader.hpp>

namespace {

using wallet_scoring::InputUnreadableError;
using wallet_scoring::TransactionLoader;

constexpr std::string_view kThreeRecords = R"([
  {"userWallet": "0xABC", "action": "deposit", "timestamp": 1629178166,
   "actionData": {"amount": "2000000000", "assetSymbol": "USDC", "assetPriceUSD": "0.000001"}},
  {"userWallet": "0xabc", "action": "borrow", "timestamp": 1629100000,
   "actionData": {"amount": 500, "assetSymbol": "DAI", "assetPriceUSD": 1.0}},
  {"userWallet": "0xdef", "action": "redeemunderlying", "timestamp": "1629200000",
   "actionData": {"amount": "10", "assetSymbol": "WETH", "assetPriceUSD": "3000"}}
])";

}  // namespace

TEST(TransactionLoader, GroupsByLowerCasedWalletAndSortsByTime) {
    const auto log = TransactionLoader{}.LoadFromString(kThreeRecords);

    EXPECT_EQ(log.records_read, 3u);
    EXPECT_EQ(log.records_dropped, 0u);
    ASSERT_EQ(log.WalletCount(), 2u);

    const auto& abc = log.by_wallet.at("0xabc");
    ASSERT_EQ(abc.size(), 2u);
    EXPECT_EQ(abc[0].action(), wallet::Transaction::BORROW);
    EXPECT_EQ(abc[1].action(), wallet::Transaction::DEPOSIT);
    EXPECT_LT(abc[0].timestamp(), abc[1].timestamp());
    EXPECT_DOUBLE_EQ(abc[1].amount_usd(), 2000.0);

    const auto& def = log.by_wallet.at("0xdef");
    ASSERT_EQ(def.size(), 1u);
    EXPECT_EQ(def[0].action(), wallet::Transaction::REDEEM_UNDERLYING);
    EXPECT_EQ(def[0].timestamp(), 1629200000);
    EXPECT_DOUBLE_EQ(def[0].amount_usd(), 30000.0);
}

TEST(TransactionLoader, DropsMalformedRecordAndKeepsTheRest) {
    const auto log = TransactionLoader{}.LoadFromString(R"([
      {"userWallet": "0x1", "action": "deposit", "timestamp": 100,
       "actionData": {"amount": "1", "assetPriceUSD": "1"}},
      {"userWallet": "0x1", "action": "teleport", "timestamp": 200,
       "actionData": {"amount": "1", "assetPriceUSD": "1"}},
      {"userWallet": "0x2", "action": "repay", "timestamp": 300,
       "actionData": {"amount": "1", "assetPriceUSD": "1"}},
      {"userWallet": "0x3", "action": "deposit",
       "actionData": {"amount": "1", "assetPriceUSD": "1"}}
    ])");

    EXPECT_EQ(log.records_read, 4u);
    EXPECT_EQ(log.records_dropped, 2u);
    EXPECT_EQ(log.ProcessedCount(), 2u);
    EXPECT_EQ(log.WalletCount(), 2u);
    EXPECT_EQ(log.by_wallet.count("0x3"), 0u);
}

TEST(TransactionLoader, DropsRecordWithoutWallet) {
    const auto log = TransactionLoader{}.LoadFromString(R"([
      {"action": "deposit", "timestamp": 100,
       "actionData": {"amount": "1", "assetPriceUSD": "1"}},
      {"userWallet": null, "action": "deposit", "timestamp": 100,
       "actionData": {"amount": "1", "assetPriceUSD": "1"}},
      {"userWallet": "0x1", "action": "deposit", "timestamp": 100,
       "actionData": {"amount": "1", "assetPriceUSD": "1"}}
    ])");

    EXPECT_EQ(log.records_read, 3u);
    EXPECT_EQ(log.records_dropped, 2u);
    ASSERT_EQ(log.WalletCount(), 1u);
    EXPECT_EQ(log.by_wallet.count("0x1"), 1u);
}

TEST(TransactionLoader, DropsRecordWhoseUsdValueOverflows) {
    const auto log = TransactionLoader{}.LoadFromString(R"([
      {"userWallet": "0x1", "action": "deposit", "timestamp": 100,
       "actionData": {"amount": 1e300, "assetPriceUSD": 1e10}},
      {"userWallet": "0x1", "action": "deposit", "timestamp": 200,
       "actionData": {"amount": "1e20", "assetPriceUSD": "1"}},
      {"userWallet": "0x1", "action": "deposit", "timestamp": 300,
       "actionData": {"amount": "5", "assetPriceUSD": "-2"}},
      {"userWallet": "0x1", "action": "deposit", "timestamp": 400,
       "actionData": {"amount": "5", "assetPriceUSD": "2"}}
    ])");

    EXPECT_EQ(log.records_read, 4u);
    EXPECT_EQ(log.records_dropped, 3u);
    ASSERT_EQ(log.ProcessedCount(), 1u);
    EXPECT_DOUBLE_EQ(log.by_wallet.at("0x1").front().amount_usd(), 10.0);
}

TEST(TransactionLoader, DropsWalletThatCannotBeStoredInTable) {
    const auto log = TransactionLoader{}.LoadFromString(R"([
      {"userWallet": "0xa,b", "action": "deposit", "timestamp": 100,
       "actionData": {"amount": "1", "assetPriceUSD": "1"}},
      {"userWallet": "0x\"q\"", "action": "deposit", "timestamp": 100,
       "actionData": {"amount": "1", "assetPriceUSD": "1"}},
      {"userWallet": "0xa\nb", "action": "deposit", "timestamp": 100,
       "actionData": {"amount": "1", "assetPriceUSD": "1"}}
    ])");

    EXPECT_EQ(log.records_read, 3u);
    EXPECT_EQ(log.records_dropped, 3u);
    EXPECT_EQ(log.WalletCount(), 0u);
}

TEST(TransactionLoader, ValuesMissingPriceAtZero) {
    const auto log = TransactionLoader{}.LoadFromString(R"([
      {"userWallet": "0x1", "action": "deposit", "timestamp": 100,
       "actionData": {"amount": "42", "assetSymbol": "UNKNOWN"}}
    ])");

    ASSERT_EQ(log.ProcessedCount(), 1u);
    const auto& tx = log.by_wallet.at("0x1").front();
    EXPECT_DOUBLE_EQ(tx.amount(), 42.0);
    EXPECT_DOUBLE_EQ(tx.amount_usd(), 0.0);
}

TEST(TransactionLoader, LiquidationFallsBackToCollateralFields) {
    const auto log = TransactionLoader{}.LoadFromString(R"([
      {"userWallet": "0x1", "action": "liquidationcall", "timestamp": 100,
       "actionData": {"collateralAmount": "2", "collateralAssetPriceUSD": "1500",
                      "collateralReserveSymbol": "WETH"}}
    ])");

    ASSERT_EQ(log.ProcessedCount(), 1u);
    const auto& tx = log.by_wallet.at("0x1").front();
    EXPECT_EQ(tx.action(), wallet::Transaction::LIQUIDATION_CALL);
    EXPECT_EQ(tx.asset_symbol(), "WETH");
    EXPECT_DOUBLE_EQ(tx.amount_usd(), 3000.0);
}

TEST(TransactionLoader, RejectsNegativeAndUnparseableAmounts) {
    const auto log = TransactionLoader{}.LoadFromString(R"([
      {"userWallet": "0x1", "action": "deposit", "timestamp": 100,
       "actionData": {"amount": "-5", "assetPriceUSD": "1"}},
      {"userWallet": "0x1", "action": "deposit", "timestamp": 100,
       "actionData": {"amount": "lots", "assetPriceUSD": "1"}},
      {"userWallet": "", "action": "deposit", "timestamp": 100,
       "actionData": {"amount": "1", "assetPriceUSD": "1"}}
    ])");

    EXPECT_EQ(log.records_read, 3u);
    EXPECT_EQ(log.records_dropped, 3u);
    EXPECT_EQ(log.WalletCount(), 0u);
}

TEST(TransactionLoader, ParsesActionsCaseInsensitively) {
    EXPECT_EQ(TransactionLoader::ParseAction("Deposit"), wallet::Transaction::DEPOSIT);
    EXPECT_EQ(TransactionLoader::ParseAction(" BORROW "), wallet::Transaction::BORROW);
    EXPECT_EQ(TransactionLoader::ParseAction("withdraw"), wallet::Transaction::REDEEM_UNDERLYING);
    EXPECT_EQ(TransactionLoader::ParseAction("liquidation"), wallet::Transaction::LIQUIDATION_CALL);
    EXPECT_FALSE(TransactionLoader::ParseAction("swap").has_value());
}

TEST(TransactionLoader, ParsesTimestampFormats) {
    namespace json = userver::formats::json;
    EXPECT_EQ(TransactionLoader::ParseTimestamp(json::FromString("[1629178166]")[0]), 1629178166);
    EXPECT_EQ(TransactionLoader::ParseTimestamp(json::FromString(R"(["1629178166"])")[0]), 1629178166);
    EXPECT_EQ(TransactionLoader::ParseTimestamp(json::FromString(R"(["2021-08-17T05:29:26Z"])")[0]),
              1629178166);
    EXPECT_EQ(TransactionLoader::ParseTimestamp(json::FromString(R"(["2021-08-17T05:29:26.250"])")[0]),
              1629178166);
    EXPECT_FALSE(TransactionLoader::ParseTimestamp(json::FromString(R"(["yesterday"])")[0]).has_value());
    EXPECT_FALSE(TransactionLoader::ParseTimestamp(json::FromString("[null]")[0]).has_value());
}

TEST(TransactionLoader, RejectsTimestampsOutsideInt64) {
    namespace json = userver::formats::json;
    EXPECT_FALSE(TransactionLoader::ParseTimestamp(json::FromString("[1e30]")[0]).has_value());
    EXPECT_FALSE(TransactionLoader::ParseTimestamp(json::FromString("[-1e30]")[0]).has_value());
    EXPECT_FALSE(TransactionLoader::ParseTimestamp(json::FromString("[18446744073709551615]")[0]).has_value());
    EXPECT_EQ(TransactionLoader::ParseTimestamp(json::FromString("[1629178166.75]")[0]), 1629178166);

    const auto log = TransactionLoader{}.LoadFromString(R"([
      {"userWallet": "0x1", "action": "deposit", "timestamp": 1e30,
       "actionData": {"amount": "1", "assetPriceUSD": "1"}}
    ])");
    EXPECT_EQ(log.records_dropped, 1u);
}

TEST(TransactionLoader, UnreadableInputIsFatal) {
    const TransactionLoader loader;
    EXPECT_THROW(loader.LoadFromString("{not json"), InputUnreadableError);
    EXPECT_THROW(loader.LoadFromString(R"({"userWallet": "0x1"})"), InputUnreadableError);
    EXPECT_THROW(loader.LoadFromFile("/nonexistent/transactions.json"), InputUnreadableError);
}

TEST(TransactionLoader, EmptyArrayYieldsEmptyLog) {
    const auto log = TransactionLoader{}.LoadFromString("[]");
    EXPECT_EQ(log.records_read, 0u);
    EXPECT_EQ(log.WalletCount(), 0u);
}

#include <gtest/gtest.h>

#include <string>

#include <userver/fs/blocking/read.hpp>
#include <userver/fs/blocking/temp_directory.hpp>

#include <score_table/score_table.hpp>

namespace {

using wallet_scoring::ScoreTable;
using wallet_scoring::ScoreTableFormatError;

const ScoreTable kTable{
    {"0xaaa", 1000, 0, 612.5},
    {"0xbbb", 500, -1, 550.0},
    {"0xccc", 0, 1, -250.125},
};

}  // namespace

TEST(ScoreTable, SerializesHeaderAndRows) {
    EXPECT_EQ(wallet_scoring::SerializeScoreTable(kTable),
              "userWallet,credit_score,cluster_label,raw_score\n"
              "0xaaa,1000,0,612.500000\n"
              "0xbbb,500,-1,550.000000\n"
              "0xccc,0,1,-250.125000\n");
}

TEST(ScoreTable, ParsesWhatItWrites) {
    const auto parsed = wallet_scoring::ParseScoreTable(wallet_scoring::SerializeScoreTable(kTable));
    ASSERT_EQ(parsed.size(), kTable.size());
    for (std::size_t i = 0; i < kTable.size(); ++i) {
        EXPECT_EQ(parsed[i].user_wallet, kTable[i].user_wallet);
        EXPECT_EQ(parsed[i].credit_score, kTable[i].credit_score);
        EXPECT_EQ(parsed[i].cluster_label, kTable[i].cluster_label);
        EXPECT_DOUBLE_EQ(parsed[i].raw_score, kTable[i].raw_score);
    }
}

TEST(ScoreTable, RejectsMalformedCsv) {
    EXPECT_THROW(wallet_scoring::ParseScoreTable(""), ScoreTableFormatError);
    EXPECT_THROW(wallet_scoring::ParseScoreTable("wallet,score\n"), ScoreTableFormatError);
    EXPECT_THROW(wallet_scoring::ParseScoreTable("userWallet,credit_score,cluster_label,raw_score\n"
                                                 "0xaaa,high,0,1.0\n"),
                 ScoreTableFormatError);
    EXPECT_THROW(wallet_scoring::ParseScoreTable("userWallet,credit_score,cluster_label,raw_score\n"
                                                 "0xaaa,10,0\n"),
                 ScoreTableFormatError);
}

TEST(ScoreTable, RefusesWalletThatWouldBreakColumns) {
    const ScoreTable with_comma{{"0xa,b", 10, 0, 1.0}};
    const ScoreTable with_newline{{"0xa\nb", 10, 0, 1.0}};
    EXPECT_THROW(wallet_scoring::SerializeScoreTable(with_comma), ScoreTableFormatError);
    EXPECT_THROW(wallet_scoring::SerializeScoreTable(with_newline), ScoreTableFormatError);

    const auto dir = userver::fs::blocking::TempDirectory::Create();
    const auto path = dir.GetPath() + "/wallet_scores.csv";
    EXPECT_THROW(wallet_scoring::WriteScoreTable(path, with_comma), ScoreTableFormatError);
    EXPECT_FALSE(userver::fs::blocking::FileExists(path));
}

TEST(ScoreTable, WritesIntoMissingDirectories) {
    const auto dir = userver::fs::blocking::TempDirectory::Create();
    const auto path = dir.GetPath() + "/nested/out/wallet_scores.csv";

    wallet_scoring::WriteScoreTable(path, kTable);
    EXPECT_EQ(userver::fs::blocking::ReadFileContents(path), wallet_scoring::SerializeScoreTable(kTable));

    const auto read_back = wallet_scoring::ReadScoreTable(path);
    ASSERT_EQ(read_back.size(), 3u);
    EXPECT_EQ(read_back[2].user_wallet, "0xccc");
}

TEST(ScoreTable, FeatureMatrixHasOneRowPerWallet) {
    const auto dir = userver::fs::blocking::TempDirectory::Create();
    const auto path = dir.GetPath() + "/features.csv";

    wallet_scoring::FeatureTable features;
    features["0xaaa"].deposit_count = 3.0;
    features["0xbbb"].borrow_count = 1.0;
    wallet_scoring::WriteFeatureMatrix(path, features);

    const auto contents = userver::fs::blocking::ReadFileContents(path);
    EXPECT_EQ(contents.rfind("userWallet,wallet_age_days,", 0), 0u);
    EXPECT_NE(contents.find("\n0xaaa,"), std::string::npos);
    EXPECT_NE(contents.find("\n0xbbb,"), std::string::npos);
}

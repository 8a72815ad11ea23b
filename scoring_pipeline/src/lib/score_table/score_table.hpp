#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "feature_aggregator/wallet_features.hpp"

namespace wallet_scoring {

struct ScoreRow {
    std::string user_wallet;
    int credit_score = 0;
    int cluster_label = -1;
    double raw_score = 0.0;
};

using ScoreTable = std::vector<ScoreRow>;

class ScoreTableFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// CSV with header "userWallet,credit_score,cluster_label,raw_score". Fields
// are unquoted; a wallet containing a comma, quote or line break is rejected
// with ScoreTableFormatError.
std::string SerializeScoreTable(const ScoreTable& table);
ScoreTable ParseScoreTable(std::string_view csv);

// Writes through a temporary file and a rename, so readers never observe
// a partially written table. Creates missing parent directories.
void WriteScoreTable(const std::string& path, const ScoreTable& table);
ScoreTable ReadScoreTable(const std::string& path);

void WriteFeatureMatrix(const std::string& path, const FeatureTable& features);

}  // namespace wallet_scoring

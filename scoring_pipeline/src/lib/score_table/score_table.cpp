#include "score_table.hpp"

#include <iterator>
#include <sstream>
#include <utility>

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <fmt/format.h>

#include <userver/fs/blocking/read.hpp>
#include <userver/fs/blocking/write.hpp>
#include <userver/logging/log.hpp>

namespace wallet_scoring {

namespace {

constexpr std::string_view kHeader = "userWallet,credit_score,cluster_label,raw_score";
constexpr std::string_view kUnsafeFieldChars = ",\"\r\n";

boost::filesystem::perms FilePerms() {
    return boost::filesystem::perms::owner_read | boost::filesystem::perms::owner_write |
           boost::filesystem::perms::group_read | boost::filesystem::perms::others_read;
}

std::vector<std::string> SplitLine(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream ss(line);
    while (std::getline(ss, field, ',')) {
        fields.push_back(field);
    }
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

template <typename T, typename Converter>
T ParseField(const std::string& field, std::size_t line_number, std::string_view name, Converter convert) {
    try {
        std::size_t pos = 0;
        T value = convert(field, &pos);
        if (pos != field.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return value;
    } catch (const std::logic_error& e) {
        throw ScoreTableFormatError(
            fmt::format("line {}: invalid {} '{}': {}", line_number, name, field, e.what()));
    }
}

void WriteAtomically(const std::string& path, std::string_view contents) {
    const auto parent = boost::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        userver::fs::blocking::CreateDirectories(parent.string());
    }
    userver::fs::blocking::RewriteFileContentsAtomically(path, contents, FilePerms());
}

}  // namespace

std::string SerializeScoreTable(const ScoreTable& table) {
    fmt::memory_buffer buffer;
    fmt::format_to(std::back_inserter(buffer), "{}\n", kHeader);
    for (const auto& row : table) {
        if (row.user_wallet.find_first_of(kUnsafeFieldChars) != std::string::npos) {
            throw ScoreTableFormatError(
                fmt::format("wallet address '{}' cannot be stored unquoted", row.user_wallet));
        }
        fmt::format_to(std::back_inserter(buffer), "{},{},{},{:.6f}\n",
                       row.user_wallet, row.credit_score, row.cluster_label, row.raw_score);
    }
    return fmt::to_string(buffer);
}

ScoreTable ParseScoreTable(std::string_view csv) {
    std::istringstream input{std::string(csv)};
    std::string line;
    if (!std::getline(input, line)) {
        throw ScoreTableFormatError("score table is empty");
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line != kHeader) {
        throw ScoreTableFormatError(fmt::format("unexpected score table header '{}'", line));
    }

    ScoreTable table;
    std::size_t line_number = 1;
    while (std::getline(input, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        const auto fields = SplitLine(line);
        if (fields.size() != 4) {
            throw ScoreTableFormatError(
                fmt::format("line {}: expected 4 fields, got {}", line_number, fields.size()));
        }
        ScoreRow row;
        row.user_wallet = fields[0];
        if (row.user_wallet.empty()) {
            throw ScoreTableFormatError(fmt::format("line {}: empty wallet address", line_number));
        }
        row.credit_score = ParseField<int>(fields[1], line_number, "credit_score",
                                           [](const std::string& s, std::size_t* pos) { return std::stoi(s, pos); });
        row.cluster_label = ParseField<int>(fields[2], line_number, "cluster_label",
                                            [](const std::string& s, std::size_t* pos) { return std::stoi(s, pos); });
        row.raw_score = ParseField<double>(fields[3], line_number, "raw_score",
                                           [](const std::string& s, std::size_t* pos) { return std::stod(s, pos); });
        table.push_back(std::move(row));
    }
    return table;
}

void WriteScoreTable(const std::string& path, const ScoreTable& table) {
    WriteAtomically(path, SerializeScoreTable(table));
    LOG_INFO() << "Saved " << table.size() << " wallet scores to " << path;
}

ScoreTable ReadScoreTable(const std::string& path) {
    auto table = ParseScoreTable(userver::fs::blocking::ReadFileContents(path));
    LOG_INFO() << "Read " << table.size() << " wallet scores from " << path;
    return table;
}

void WriteFeatureMatrix(const std::string& path, const FeatureTable& features) {
    fmt::memory_buffer buffer;
    fmt::format_to(std::back_inserter(buffer), "userWallet");
    for (const auto& [name, value] : FeatureColumns(WalletFeatureVector{})) {
        fmt::format_to(std::back_inserter(buffer), ",{}", name);
    }
    fmt::format_to(std::back_inserter(buffer), "\n");

    for (const auto& [wallet, vector] : features) {
        fmt::format_to(std::back_inserter(buffer), "{}", wallet);
        for (const auto& [name, value] : FeatureColumns(vector)) {
            fmt::format_to(std::back_inserter(buffer), ",{}", value);
        }
        fmt::format_to(std::back_inserter(buffer), "\n");
    }

    WriteAtomically(path, fmt::to_string(buffer));
    LOG_INFO() << "Saved feature matrix for " << features.size() << " wallets to " << path;
}

}  // namespace wallet_scoring

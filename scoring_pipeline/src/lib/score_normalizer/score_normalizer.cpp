#include "score_normalizer.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <stdexcept>

#include <userver/logging/log.hpp>

namespace wallet_scoring {

namespace {

int RoundHalfUp(double value) {
    return static_cast<int>(std::floor(value + 0.5));
}

}  // namespace

std::vector<int> NormalizeScores(const std::vector<double>& scores) {
    const std::size_t n = scores.size();
    std::vector<int> result(n, kMinFinalScore);
    if (n == 0) {
        return result;
    }
    if (std::any_of(scores.begin(), scores.end(), [](double s) { return !std::isfinite(s); })) {
        throw std::invalid_argument("cannot normalize non-finite scores");
    }
    if (n == 1) {
        result[0] = (kMinFinalScore + kMaxFinalScore) / 2;
        return result;
    }

    std::vector<std::size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&scores](std::size_t lhs, std::size_t rhs) { return scores[lhs] < scores[rhs]; });

    const double span = static_cast<double>(kMaxFinalScore - kMinFinalScore);
    const double last_rank = static_cast<double>(n - 1);
    std::size_t group_begin = 0;
    while (group_begin < n) {
        std::size_t group_end = group_begin + 1;
        while (group_end < n && scores[order[group_end]] == scores[order[group_begin]]) {
            ++group_end;
        }
        const double mid_rank = static_cast<double>(group_begin + group_end - 1) / 2.0;
        const int final_score = std::clamp(
            kMinFinalScore + RoundHalfUp(mid_rank * span / last_rank), kMinFinalScore, kMaxFinalScore);
        for (std::size_t i = group_begin; i < group_end; ++i) {
            result[order[i]] = final_score;
        }
        group_begin = group_end;
    }

    LOG_DEBUG() << "Normalized " << n << " scores onto [" << kMinFinalScore << ", " << kMaxFinalScore << "]";
    return result;
}

}  // namespace wallet_scoring

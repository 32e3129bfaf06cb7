#pragma once

#include "libkeyscore/metric_params.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace libkeyscore {

struct MetricResult {
    std::string name;
    MetricKind kind{MetricKind::KeyCosts};
    NgramOrder order{NgramOrder::Unigram};
    double raw_cost{0.0};
    double weight_found{0.0};
    double weight_all{0.0};
    double normalized_cost{0.0};
    double weight{0.0};
    double weighted_cost{0.0};
    std::optional<std::string> message{};
};

struct EvaluationResult {
    std::vector<MetricResult> metrics;
    double total_cost{0.0};
    double unigrams_not_found{0.0};
    double bigrams_not_found{0.0};
    double trigrams_not_found{0.0};

    [[nodiscard]] const MetricResult* find(std::string_view name) const noexcept;
};

// One line per metric, grouped by ngram order, followed by the total.
[[nodiscard]] std::string format_evaluation(const EvaluationResult& result);

}  // namespace libkeyscore

#include "libkeyscore/evaluation_result.hpp"

#include <iomanip>
#include <sstream>

namespace libkeyscore {

namespace {
const char* order_title(NgramOrder order) noexcept {
    switch (order) {
        case NgramOrder::Unigram:
            return "Unigram metrics";
        case NgramOrder::Bigram:
            return "Bigram metrics";
        case NgramOrder::Trigram:
            return "Trigram metrics";
    }
    return "Metrics";
}
}  // namespace

const MetricResult* EvaluationResult::find(std::string_view name) const noexcept {
    for (const auto& metric : metrics) {
        if (metric.name == name) {
            return &metric;
        }
    }
    return nullptr;
}

std::string format_evaluation(const EvaluationResult& result) {
    std::ostringstream oss;
    oss << std::fixed;
    for (NgramOrder order : {NgramOrder::Unigram, NgramOrder::Bigram, NgramOrder::Trigram}) {
        bool header_written = false;
        for (const auto& metric : result.metrics) {
            if (metric.order != order) {
                continue;
            }
            if (!header_written) {
                oss << order_title(order) << '\n';
                header_written = true;
            }
            oss << "  " << std::setprecision(4) << std::setw(12) << metric.weighted_cost << " (weighted)  "
                << std::setw(10) << metric.normalized_cost << " (normalized)  " << metric.name;
            if (metric.message) {
                oss << "  " << *metric.message;
            }
            oss << '\n';
        }
    }

    const auto not_found = [&oss](const char* label, double weight) {
        if (weight > 0.0) {
            oss << "Not found " << label << ": " << std::setprecision(4) << 100.0 * weight << "%\n";
        }
    };
    not_found("unigrams", result.unigrams_not_found);
    not_found("bigrams", result.bigrams_not_found);
    not_found("trigrams", result.trigrams_not_found);

    oss << "Cost: " << std::setprecision(4) << result.total_cost << '\n';
    return oss.str();
}

}  // namespace libkeyscore

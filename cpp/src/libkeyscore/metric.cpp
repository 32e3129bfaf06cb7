#include "libkeyscore/metric.hpp"

#include <cstddef>

namespace libkeyscore {

MetricCost BigramMetric::evaluate(const Layout& layout, const MappedNgrams& ngrams, bool parallel) const {
    const auto& bigrams = ngrams.bigrams;
    const auto& layerkeys = layout.layerkeys();
    const auto n = static_cast<std::ptrdiff_t>(bigrams.size());
    const bool use_parallel = parallel && bigrams.size() > kParallelThreshold;

    double cost = 0.0;
    double found = 0.0;
    double all = 0.0;
#pragma omp parallel for reduction(+ : cost, found, all) if (use_parallel)
    for (std::ptrdiff_t i = 0; i < n; ++i) {
        const auto& bigram = bigrams[static_cast<std::size_t>(i)];
        const double unit = individual_cost(layout, layerkeys[bigram.keys[0]], layerkeys[bigram.keys[1]]);
        cost += bigram.weight * unit;
        all += bigram.weight;
        if (unit != 0.0) {
            found += bigram.weight;
        }
    }
    return MetricCost{cost, found, all, std::nullopt};
}

MetricCost TrigramMetric::evaluate(const Layout& layout, const MappedNgrams& ngrams, bool parallel) const {
    const auto& trigrams = ngrams.trigrams;
    const auto& layerkeys = layout.layerkeys();
    const auto n = static_cast<std::ptrdiff_t>(trigrams.size());
    const bool use_parallel = parallel && trigrams.size() > kParallelThreshold;

    double cost = 0.0;
    double found = 0.0;
    double all = 0.0;
#pragma omp parallel for reduction(+ : cost, found, all) if (use_parallel)
    for (std::ptrdiff_t i = 0; i < n; ++i) {
        const auto& trigram = trigrams[static_cast<std::size_t>(i)];
        const auto& k1 = layerkeys[trigram.keys[0]];
        const auto& k2 = layerkeys[trigram.keys[1]];
        const auto& k3 = layerkeys[trigram.keys[2]];
        if (skips(k1, k2, k3)) {
            continue;
        }
        const double unit = individual_cost(layout, k1, k2, k3);
        cost += trigram.weight * unit;
        all += trigram.weight;
        if (unit != 0.0) {
            found += trigram.weight;
        }
    }
    return MetricCost{cost, found, all, std::nullopt};
}

double combined_bigram_cost(const std::vector<WeightedBigramMetric>& metrics,
                            const Layout& layout,
                            const LayerKey& k1,
                            const LayerKey& k2) noexcept {
    double total = 0.0;
    for (const auto& entry : metrics) {
        total += entry.weight * entry.metric->individual_cost(layout, k1, k2);
    }
    return total;
}

}  // namespace libkeyscore

#include "libkeyscore/key_costs.hpp"

#include <cstddef>

namespace libkeyscore {

MetricCost KeyCosts::evaluate(const Layout& layout, const MappedNgrams& ngrams, bool parallel) const {
    const auto& unigrams = ngrams.unigrams;
    const auto& layerkeys = layout.layerkeys();
    const auto n = static_cast<std::ptrdiff_t>(unigrams.size());
    const bool use_parallel = parallel && unigrams.size() > kParallelThreshold;

    double cost = 0.0;
    double all = 0.0;
#pragma omp parallel for reduction(+ : cost, all) if (use_parallel)
    for (std::ptrdiff_t i = 0; i < n; ++i) {
        const auto& unigram = unigrams[static_cast<std::size_t>(i)];
        cost += unigram.weight * layerkeys[unigram.keys[0]].key.cost;
        all += unigram.weight;
    }
    return MetricCost{cost, all, all, std::nullopt};
}

}  // namespace libkeyscore

#include "libkeyscore/irregularity.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace libkeyscore {

Irregularity::Irregularity(std::vector<WeightedBigramMetric> bigram_metrics) : bigram_metrics_(std::move(bigram_metrics)) {
    for (const auto& entry : bigram_metrics_) {
        if (!entry.metric) {
            throw std::invalid_argument("irregularity requires non-null bigram metrics");
        }
    }
}

double Irregularity::individual_cost(const Layout& layout,
                                     const LayerKey& k1,
                                     const LayerKey& k2,
                                     const LayerKey& k3) const noexcept {
    const double front = combined_bigram_cost(bigram_metrics_, layout, k1, k2);
    const double back = combined_bigram_cost(bigram_metrics_, layout, k2, k3);
    const double product = front * back;
    return product > 0.0 ? std::sqrt(product) : 0.0;
}

}  // namespace libkeyscore

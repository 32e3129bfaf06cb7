#pragma once

#include "libkeyscore/metric.hpp"

#include <vector>

namespace libkeyscore {

/**
 * Unevenness of a trigram's two halves.
 *
 * The combined bigram cost of (k1, k2) and of (k2, k3) is computed with the weighted bigram
 * metrics; the trigram costs the square root of their product, or zero if the product is not
 * positive.
 */
class Irregularity final : public TrigramMetric {
public:
    explicit Irregularity(std::vector<WeightedBigramMetric> bigram_metrics);

    [[nodiscard]] double individual_cost(const Layout& layout,
                                         const LayerKey& k1,
                                         const LayerKey& k2,
                                         const LayerKey& k3) const noexcept override;

private:
    std::vector<WeightedBigramMetric> bigram_metrics_;
};

}  // namespace libkeyscore

#pragma once

#include "libkeyscore/metric.hpp"

#include <vector>

namespace libkeyscore {

// Combined bigram cost of a trigram's first and last key, skipping mental pauses.
class SecondaryBigrams final : public TrigramMetric {
public:
    SecondaryBigrams(SecondaryBigramsParams params, std::vector<WeightedBigramMetric> bigram_metrics);

    [[nodiscard]] double individual_cost(const Layout& layout,
                                         const LayerKey& k1,
                                         const LayerKey& k2,
                                         const LayerKey& k3) const noexcept override;

    [[nodiscard]] bool skips(const LayerKey& k1, const LayerKey& k2, const LayerKey& k3) const noexcept override;

private:
    SecondaryBigramsParams params_;
    std::vector<WeightedBigramMetric> bigram_metrics_;
};

}  // namespace libkeyscore

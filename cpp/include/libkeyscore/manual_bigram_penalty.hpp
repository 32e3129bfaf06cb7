#pragma once

#include "libkeyscore/metric.hpp"

namespace libkeyscore {

class ManualBigramPenalty final : public BigramMetric {
public:
    explicit ManualBigramPenalty(ManualBigramPenaltyParams params);

    [[nodiscard]] double individual_cost(const Layout& layout, const LayerKey& k1, const LayerKey& k2) const noexcept override;

private:
    ManualBigramPenaltyParams params_;
};

}  // namespace libkeyscore

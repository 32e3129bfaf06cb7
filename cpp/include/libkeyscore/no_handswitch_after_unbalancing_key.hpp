#pragma once

#include "libkeyscore/metric.hpp"

namespace libkeyscore {

class NoHandswitchAfterUnbalancingKey final : public BigramMetric {
public:
    explicit NoHandswitchAfterUnbalancingKey(NoHandswitchAfterUnbalancingKeyParams params);

    [[nodiscard]] double individual_cost(const Layout& layout, const LayerKey& k1, const LayerKey& k2) const noexcept override;

private:
    NoHandswitchAfterUnbalancingKeyParams params_;
};

}  // namespace libkeyscore

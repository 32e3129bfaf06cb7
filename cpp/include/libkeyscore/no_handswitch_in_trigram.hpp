#pragma once

#include "libkeyscore/metric.hpp"

namespace libkeyscore {

class NoHandswitchInTrigram final : public TrigramMetric {
public:
    explicit NoHandswitchInTrigram(NoHandswitchInTrigramParams params);

    [[nodiscard]] double individual_cost(const Layout& layout,
                                         const LayerKey& k1,
                                         const LayerKey& k2,
                                         const LayerKey& k3) const noexcept override;

private:
    NoHandswitchInTrigramParams params_;
};

}  // namespace libkeyscore

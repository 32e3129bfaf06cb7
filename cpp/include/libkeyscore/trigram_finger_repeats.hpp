#pragma once

#include "libkeyscore/metric.hpp"

namespace libkeyscore {

// Three distinct keys struck by one finger; each column change multiplies the cost.
class TrigramFingerRepeats final : public TrigramMetric {
public:
    explicit TrigramFingerRepeats(TrigramFingerRepeatsParams params);

    [[nodiscard]] double individual_cost(const Layout& layout,
                                         const LayerKey& k1,
                                         const LayerKey& k2,
                                         const LayerKey& k3) const noexcept override;

private:
    TrigramFingerRepeatsParams params_;
};

}  // namespace libkeyscore

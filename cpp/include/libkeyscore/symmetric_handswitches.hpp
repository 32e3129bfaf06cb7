#pragma once

#include "libkeyscore/metric.hpp"

namespace libkeyscore {

// Handswitches between keys that are not mirror images of each other.
class SymmetricHandswitches final : public BigramMetric {
public:
    [[nodiscard]] double individual_cost(const Layout& layout, const LayerKey& k1, const LayerKey& k2) const noexcept override;
};

}  // namespace libkeyscore

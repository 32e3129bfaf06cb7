#pragma once

#include "libkeyscore/metric.hpp"

namespace libkeyscore {

/**
 * Consecutive keys struck by the same finger.
 *
 * Repeating the same key costs the finger factor plus same_key_offset. Otherwise the finger
 * factor is scaled by lateral_factor for column changes, stretch_factor for upward and
 * curl_factor for downward movements in line.
 */
class FingerRepeats final : public BigramMetric {
public:
    explicit FingerRepeats(FingerRepeatsParams params);

    [[nodiscard]] double individual_cost(const Layout& layout, const LayerKey& k1, const LayerKey& k2) const noexcept override;

private:
    FingerRepeatsParams params_;
};

}  // namespace libkeyscore

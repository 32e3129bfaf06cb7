#pragma once

#include "libkeyscore/metric.hpp"

namespace libkeyscore {

// Deviation of the left hand's share of keystrokes from one half.
class HandDisbalance final : public UnigramMetric {
public:
    explicit HandDisbalance(HandDisbalanceParams params);

    [[nodiscard]] MetricCost evaluate(const Layout& layout, const MappedNgrams& ngrams, bool parallel) const override;

private:
    HandDisbalanceParams params_;
};

}  // namespace libkeyscore

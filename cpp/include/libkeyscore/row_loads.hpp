#pragma once

#include "libkeyscore/metric.hpp"

namespace libkeyscore {

// Reports the share of keystrokes per row; never contributes a cost.
class RowLoads final : public UnigramMetric {
public:
    [[nodiscard]] MetricCost evaluate(const Layout& layout, const MappedNgrams& ngrams, bool parallel) const override;
};

}  // namespace libkeyscore

#pragma once

#include "libkeyscore/metric.hpp"

namespace libkeyscore {

class FingerBalance final : public UnigramMetric {
public:
    explicit FingerBalance(FingerBalanceParams params);

    [[nodiscard]] MetricCost evaluate(const Layout& layout, const MappedNgrams& ngrams, bool parallel) const override;

private:
    FingerBalanceParams params_;
};

}  // namespace libkeyscore

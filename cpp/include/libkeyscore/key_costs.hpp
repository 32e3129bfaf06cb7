#pragma once

#include "libkeyscore/metric.hpp"

namespace libkeyscore {

// Sum of per-keystroke key costs weighted by unigram frequency.
class KeyCosts final : public UnigramMetric {
public:
    [[nodiscard]] MetricCost evaluate(const Layout& layout, const MappedNgrams& ngrams, bool parallel) const override;
};

}  // namespace libkeyscore

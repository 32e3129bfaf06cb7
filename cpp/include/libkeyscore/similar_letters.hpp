#pragma once

#include "libkeyscore/metric.hpp"

namespace libkeyscore {

class SimilarLetters final : public UnigramMetric {
public:
    explicit SimilarLetters(SimilarLettersParams params);

    [[nodiscard]] MetricCost evaluate(const Layout& layout, const MappedNgrams& ngrams, bool parallel) const override;

private:
    SimilarLettersParams params_;
};

}  // namespace libkeyscore

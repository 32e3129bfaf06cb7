#pragma once

#include "libkeyscore/metric.hpp"

namespace libkeyscore {

/**
 * Groups of related symbols should share one relative placement.
 *
 * For each group pair, the placement of group-1[i] relative to group-2[i] is compared across
 * all index pairs i < j; deviations are weighted by the unigram weight of the four symbols.
 */
class SimilarLetterGroups final : public UnigramMetric {
public:
    explicit SimilarLetterGroups(SimilarLetterGroupsParams params);

    [[nodiscard]] MetricCost evaluate(const Layout& layout, const MappedNgrams& ngrams, bool parallel) const override;

private:
    SimilarLetterGroupsParams params_;
};

}  // namespace libkeyscore

#pragma once

#include "libkeyscore/metric.hpp"

namespace libkeyscore {

// Trigram metric that ignores trigrams touching keys excluded by a RollFilter.
class RollMetric : public TrigramMetric {
public:
    explicit RollMetric(RollFilter filter);

    [[nodiscard]] bool skips(const LayerKey& k1, const LayerKey& k2, const LayerKey& k3) const noexcept override;

private:
    [[nodiscard]] bool excluded(const LayerKey& key) const noexcept;

    RollFilter filter_;
};

// Three keys of one hand in strictly monotonic finger order.
class TrigramRolls final : public RollMetric {
public:
    explicit TrigramRolls(TrigramRollsParams params);

    [[nodiscard]] double individual_cost(const Layout& layout,
                                         const LayerKey& k1,
                                         const LayerKey& k2,
                                         const LayerKey& k3) const noexcept override;

private:
    double factor_inward_;
    double factor_outward_;
};

/**
 * Two adjacent keys of one hand on different fingers, with the remaining key on the other
 * hand. Counts one per trigram whose same-hand pair rolls in the configured direction.
 */
class OxeyRolls final : public RollMetric {
public:
    explicit OxeyRolls(OxeyRollsParams params);

    [[nodiscard]] RollDirection direction() const noexcept { return direction_; }

    [[nodiscard]] double individual_cost(const Layout& layout,
                                         const LayerKey& k1,
                                         const LayerKey& k2,
                                         const LayerKey& k3) const noexcept override;

private:
    RollDirection direction_;
};

}  // namespace libkeyscore

#pragma once

#include "libkeyscore/metric.hpp"

namespace libkeyscore {

/**
 * Cost of moving between two fingers of one hand.
 *
 * The configured finger switch cost is scaled by the rows crossed (plus same_row_offset), by a
 * factor for awkward length transitions, by the number of unbalancing keys involved and by
 * columns reached beyond the fingers' natural spread.
 */
class MovementPattern final : public BigramMetric {
public:
    explicit MovementPattern(MovementPatternParams params);

    [[nodiscard]] double individual_cost(const Layout& layout, const LayerKey& k1, const LayerKey& k2) const noexcept override;

private:
    MovementPatternParams params_;
};

}  // namespace libkeyscore

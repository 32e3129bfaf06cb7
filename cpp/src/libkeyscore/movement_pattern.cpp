#include "libkeyscore/movement_pattern.hpp"

#include "libkeyscore/key_geometry.hpp"

#include <cstdlib>
#include <utility>

namespace libkeyscore {

MovementPattern::MovementPattern(MovementPatternParams params) : params_(std::move(params)) {}

double MovementPattern::individual_cost(const Layout& /*layout*/, const LayerKey& k1, const LayerKey& k2) const noexcept {
    const Key& from = k1.key;
    const Key& to = k2.key;
    if (from.hand != to.hand || from.finger == to.finger) {
        return 0.0;
    }

    const double base = params_.finger_switch_factor(static_cast<Eigen::Index>(hand_finger_index(from.hand, from.finger)),
                                                     static_cast<Eigen::Index>(hand_finger_index(to.hand, to.finger)));
    if (base == 0.0) {
        return 0.0;
    }

    const int rows_crossed = std::abs(to.row - from.row);
    double cost = base * (params_.same_row_offset + static_cast<double>(rows_crossed));

    const auto hand = static_cast<Eigen::Index>(hand_index(from.hand));
    const double from_length = params_.finger_lengths(hand, static_cast<Eigen::Index>(finger_index(from.finger)));
    const double to_length = params_.finger_lengths(hand, static_cast<Eigen::Index>(finger_index(to.finger)));
    const bool moves_down = to.row > from.row;
    const bool moves_up = to.row < from.row;
    if ((moves_down && from_length < to_length) || (moves_up && from_length > to_length)) {
        cost *= params_.short_down_to_long_or_long_up_to_short_factor;
    }

    const int unbalancing = static_cast<int>(from.unbalancing) + static_cast<int>(to.unbalancing);
    cost *= 1.0 + params_.unbalancing_factor * static_cast<double>(unbalancing);

    const int extra_columns = std::abs(to.column - from.column) - finger_distance(from.finger, to.finger);
    if (extra_columns > 0) {
        cost *= 1.0 + params_.lateral_stretch_factor * static_cast<double>(extra_columns);
    }
    return cost;
}

}  // namespace libkeyscore

#include "libkeyscore/no_handswitch_in_trigram.hpp"

#include "libkeyscore/key_geometry.hpp"

#include <utility>

namespace libkeyscore {

NoHandswitchInTrigram::NoHandswitchInTrigram(NoHandswitchInTrigramParams params) : params_(std::move(params)) {}

double NoHandswitchInTrigram::individual_cost(const Layout& /*layout*/,
                                              const LayerKey& k1,
                                              const LayerKey& k2,
                                              const LayerKey& k3) const noexcept {
    const Key& a = k1.key;
    const Key& b = k2.key;
    const Key& c = k3.key;
    if (a.hand != b.hand || b.hand != c.hand) {
        return 0.0;
    }
    if (a.index == b.index && b.index == c.index) {
        return params_.factor_same_key;
    }

    const int first_step = roll_direction(a.finger, b.finger);
    const int second_step = roll_direction(b.finger, c.finger);
    const bool direction_change = first_step * second_step < 0;
    const bool finger_repeat = a.finger == b.finger || b.finger == c.finger;

    double cost = direction_change ? params_.factor_with_direction_change : params_.factor_without_direction_change;
    if (finger_repeat) {
        cost += params_.factor_contains_finger_repeat;
    } else if (a.index == c.index) {
        cost += params_.factor_same_key_start_end;
    }
    if (a.finger == Finger::Index || b.finger == Finger::Index || c.finger == Finger::Index) {
        cost += params_.factor_contains_index;
    }
    return cost;
}

}  // namespace libkeyscore

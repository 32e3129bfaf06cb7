#include "libkeyscore/trigram_finger_repeats.hpp"

#include <cmath>
#include <utility>

namespace libkeyscore {

TrigramFingerRepeats::TrigramFingerRepeats(TrigramFingerRepeatsParams params) : params_(std::move(params)) {}

double TrigramFingerRepeats::individual_cost(const Layout& /*layout*/,
                                             const LayerKey& k1,
                                             const LayerKey& k2,
                                             const LayerKey& k3) const noexcept {
    const Key& a = k1.key;
    const Key& b = k2.key;
    const Key& c = k3.key;
    if (a.hand != b.hand || b.hand != c.hand || a.finger != b.finger || b.finger != c.finger) {
        return 0.0;
    }
    if (a.index == b.index || b.index == c.index || a.index == c.index) {
        return 0.0;
    }
    const int lateral_moves = static_cast<int>(a.column != b.column) + static_cast<int>(b.column != c.column);
    return std::pow(params_.factor_lateral_movement, lateral_moves);
}

}  // namespace libkeyscore

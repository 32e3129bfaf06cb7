#include "libkeyscore/rolls.hpp"

#include "libkeyscore/key_geometry.hpp"

#include <algorithm>
#include <utility>

namespace libkeyscore {

namespace {
// Direction of a roll over two different fingers of one hand, or 0 if there is none.
int pair_roll(const Key& a, const Key& b) noexcept {
    if (a.hand != b.hand) {
        return 0;
    }
    return roll_direction(a.finger, b.finger);
}

constexpr int kInward = -1;
constexpr int kOutward = 1;
}  // namespace

RollMetric::RollMetric(RollFilter filter) : filter_(std::move(filter)) {}

bool RollMetric::excluded(const LayerKey& key) const noexcept {
    if (filter_.exclude_thumbs && key.key.finger == Finger::Thumb) {
        return true;
    }
    if (filter_.exclude_modifiers && key.is_modifier) {
        return true;
    }
    const auto& chars = filter_.exclude_chars;
    if (std::find(chars.begin(), chars.end(), key.symbol) != chars.end()) {
        return true;
    }
    const auto& rows = filter_.exclude_rows;
    return std::find(rows.begin(), rows.end(), key.key.row) != rows.end();
}

bool RollMetric::skips(const LayerKey& k1, const LayerKey& k2, const LayerKey& k3) const noexcept {
    return excluded(k1) || excluded(k2) || excluded(k3);
}

TrigramRolls::TrigramRolls(TrigramRollsParams params)
    : RollMetric(std::move(params.filter)), factor_inward_(params.factor_inward), factor_outward_(params.factor_outward) {}

double TrigramRolls::individual_cost(const Layout& /*layout*/,
                                     const LayerKey& k1,
                                     const LayerKey& k2,
                                     const LayerKey& k3) const noexcept {
    const Key& a = k1.key;
    const Key& b = k2.key;
    const Key& c = k3.key;
    if (a.hand != b.hand || b.hand != c.hand) {
        return 0.0;
    }
    const int first = roll_direction(a.finger, b.finger);
    const int second = roll_direction(b.finger, c.finger);
    if (first != second || first == 0) {
        return 0.0;
    }
    return first == kInward ? factor_inward_ : factor_outward_;
}

OxeyRolls::OxeyRolls(OxeyRollsParams params) : RollMetric(std::move(params.filter)), direction_(params.direction) {}

double OxeyRolls::individual_cost(const Layout& /*layout*/,
                                  const LayerKey& k1,
                                  const LayerKey& k2,
                                  const LayerKey& k3) const noexcept {
    const Key& a = k1.key;
    const Key& b = k2.key;
    const Key& c = k3.key;
    int roll = 0;
    if (a.hand == b.hand && b.hand != c.hand) {
        roll = pair_roll(a, b);
    } else if (a.hand != b.hand && b.hand == c.hand) {
        roll = pair_roll(b, c);
    }
    const int wanted = direction_ == RollDirection::Inward ? kInward : kOutward;
    return roll == wanted ? 1.0 : 0.0;
}

}  // namespace libkeyscore

#include "libkeyscore/manual_bigram_penalty.hpp"

#include "libkeyscore/key_geometry.hpp"

#include <utility>

namespace libkeyscore {

ManualBigramPenalty::ManualBigramPenalty(ManualBigramPenaltyParams params) : params_(std::move(params)) {}

double ManualBigramPenalty::individual_cost(const Layout& layout, const LayerKey& k1, const LayerKey& k2) const noexcept {
    const MatrixPosition from = k1.key.position();
    const MatrixPosition to = k2.key.position();
    if (auto it = params_.matrix_positions.find(PositionPair{from, to}); it != params_.matrix_positions.end()) {
        return it->second;
    }
    if (!params_.add_mirrored) {
        return 0.0;
    }
    const double axis = layout.symmetry_axis();
    const PositionPair mirrored{mirror_position(from, axis), mirror_position(to, axis)};
    if (auto it = params_.matrix_positions.find(mirrored); it != params_.matrix_positions.end()) {
        return it->second;
    }
    return 0.0;
}

}  // namespace libkeyscore

#include "libkeyscore/key_geometry.hpp"

#include <cmath>
#include <cstdlib>

namespace libkeyscore {

namespace {
constexpr double kColumnTolerance = 1e-9;

[[nodiscard]] double outward_sign(Hand hand) noexcept {
    return hand == Hand::Left ? -1.0 : 1.0;
}
}  // namespace

double mirror_column(int column, double symmetry_axis) noexcept {
    return 2.0 * symmetry_axis - static_cast<double>(column);
}

MatrixPosition mirror_position(const MatrixPosition& position, double symmetry_axis) noexcept {
    return MatrixPosition{static_cast<int>(std::lround(mirror_column(position.column, symmetry_axis))), position.row};
}

bool is_mirrored(const Key& a, const Key& b, double symmetry_axis) noexcept {
    if (a.hand == b.hand || a.row != b.row) {
        return false;
    }
    return std::abs(mirror_column(a.column, symmetry_axis) - static_cast<double>(b.column)) < kColumnTolerance;
}

bool are_neighbors(const Key& a, const Key& b) noexcept {
    if (a.hand != b.hand) {
        return false;
    }
    return std::abs(a.column - b.column) + std::abs(a.row - b.row) == 1;
}

RelativePlacement relative_placement(const Key& from, const Key& to, double symmetry_axis) noexcept {
    RelativePlacement placement;
    placement.crosses_hands = from.hand != to.hand;
    placement.dy = static_cast<double>(to.row - from.row);

    const double origin = placement.crosses_hands ? mirror_column(from.column, symmetry_axis)
                                                  : static_cast<double>(from.column);
    placement.dx = outward_sign(to.hand) * (static_cast<double>(to.column) - origin);
    return placement;
}

double placement_deviation(const RelativePlacement& a, const RelativePlacement& b) noexcept {
    double deviation = std::abs(a.dx - b.dx) + std::abs(a.dy - b.dy);
    if (a.crosses_hands != b.crosses_hands) {
        deviation += 1.0;
    }
    return deviation;
}

int finger_distance(Finger a, Finger b) noexcept {
    return std::abs(static_cast<int>(finger_index(a)) - static_cast<int>(finger_index(b)));
}

double key_distance(const Key& a, const Key& b) noexcept {
    const double dc = static_cast<double>(a.column - b.column);
    const double dr = static_cast<double>(a.row - b.row);
    return std::sqrt(dc * dc + dr * dr);
}

int roll_direction(Finger from, Finger to) noexcept {
    const auto f = finger_index(from);
    const auto t = finger_index(to);
    if (t < f) {
        return -1;
    }
    if (t > f) {
        return 1;
    }
    return 0;
}

}  // namespace libkeyscore

#pragma once

#include "libkeyscore/key_types.hpp"

namespace libkeyscore {

/**
 * Placement of one key relative to another.
 *
 * For keys on the same hand, dx is the column offset. For keys on opposite hands, dx is the
 * offset from the mirror image of the first key. The sign of dx is chosen so that positive
 * values point outwards (towards the pinky) on either hand. Two symbol pairs that sit on
 * mirrored halves of the keyboard therefore have identical placements.
 */
struct RelativePlacement {
    bool crosses_hands{false};
    double dx{0.0};
    double dy{0.0};
};

[[nodiscard]] double mirror_column(int column, double symmetry_axis) noexcept;

[[nodiscard]] MatrixPosition mirror_position(const MatrixPosition& position, double symmetry_axis) noexcept;

// Different hands, same row, columns reflected about the symmetry axis.
[[nodiscard]] bool is_mirrored(const Key& a, const Key& b, double symmetry_axis) noexcept;

// Same hand and a Manhattan distance of exactly one on the key matrix.
[[nodiscard]] bool are_neighbors(const Key& a, const Key& b) noexcept;

[[nodiscard]] RelativePlacement relative_placement(const Key& from, const Key& to, double symmetry_axis) noexcept;

// L1 distance between placements plus one if exactly one of them crosses hands.
[[nodiscard]] double placement_deviation(const RelativePlacement& a, const RelativePlacement& b) noexcept;

[[nodiscard]] int finger_distance(Finger a, Finger b) noexcept;

// Euclidean distance on (column, row).
[[nodiscard]] double key_distance(const Key& a, const Key& b) noexcept;

// -1 when moving towards the thumb, +1 when moving towards the pinky, 0 for the same finger.
[[nodiscard]] int roll_direction(Finger from, Finger to) noexcept;

}  // namespace libkeyscore

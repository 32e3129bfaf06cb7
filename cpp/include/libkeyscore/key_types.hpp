#pragma once

#include <compare>
#include <cstddef>
#include <string_view>
#include <vector>

#include <Eigen/Core>

namespace libkeyscore {

enum class Hand {
    Left,
    Right
};

// Ordinal order runs from the thumb outwards; rolls towards the index finger are "inward".
enum class Finger {
    Thumb,
    Index,
    Middle,
    Ring,
    Pinky
};

inline constexpr std::size_t kHandCount = 2;
inline constexpr std::size_t kFingerCount = 5;

// Rows are hands, columns are fingers in ordinal order.
using FingerMatrix = Eigen::Matrix<double, 2, 5>;

// Indexed by hand_finger_index() on both axes.
using FingerSwitchMatrix = Eigen::Matrix<double, 10, 10>;

[[nodiscard]] constexpr std::size_t hand_index(Hand hand) noexcept {
    return static_cast<std::size_t>(hand);
}

[[nodiscard]] constexpr std::size_t finger_index(Finger finger) noexcept {
    return static_cast<std::size_t>(finger);
}

[[nodiscard]] constexpr std::size_t hand_finger_index(Hand hand, Finger finger) noexcept {
    return hand_index(hand) * kFingerCount + finger_index(finger);
}

[[nodiscard]] std::string_view to_string(Hand hand) noexcept;

[[nodiscard]] std::string_view to_string(Finger finger) noexcept;

[[nodiscard]] Hand parse_hand(std::string_view name);

[[nodiscard]] Finger parse_finger(std::string_view name);

struct MatrixPosition {
    int column{0};
    int row{0};

    friend auto operator<=>(const MatrixPosition&, const MatrixPosition&) = default;
};

struct Key {
    std::size_t index{0};  // physical identity within its layout
    int column{0};
    int row{0};            // 0 = top row, grows towards the thumbs
    Hand hand{Hand::Left};
    Finger finger{Finger::Index};
    double cost{0.0};
    bool unbalancing{false};

    [[nodiscard]] MatrixPosition position() const noexcept { return MatrixPosition{column, row}; }
};

struct LayerKey {
    char32_t symbol{0};
    std::size_t layer{0};
    Key key;
    std::vector<std::size_t> modifiers;  // layer keys held to reach this symbol
    bool is_modifier{false};
};

}  // namespace libkeyscore

#pragma once

#include "libkeyscore/key_types.hpp"

#include <cmath>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <Eigen/Core>

namespace libkeyscore {

enum class MetricKind {
    ShortcutKeys,
    SimilarLetters,
    SimilarLetterGroups,
    FingerBalance,
    HandDisbalance,
    KeyCosts,
    RowLoads,
    SymmetricHandswitches,
    FingerRepeats,
    ManualBigramPenalty,
    MovementPattern,
    NoHandswitchAfterUnbalancingKey,
    Irregularity,
    NoHandswitchInTrigram,
    SecondaryBigrams,
    TrigramFingerRepeats,
    TrigramRolls,
    OxeyInwardRolls,
    OxeyOutwardRolls
};

enum class NgramOrder {
    Unigram = 1,
    Bigram = 2,
    Trigram = 3
};

[[nodiscard]] MetricKind metric_kind_from_name(std::string_view name);

[[nodiscard]] std::string_view metric_kind_name(MetricKind kind) noexcept;

[[nodiscard]] NgramOrder metric_order(MetricKind kind) noexcept;

enum class Deviation {
    Squared,
    Absolute
};

[[nodiscard]] inline double apply_deviation(Deviation deviation, double difference) noexcept {
    return deviation == Deviation::Squared ? difference * difference : std::abs(difference);
}

[[nodiscard]] Deviation parse_deviation(std::string_view name);

struct ShortcutKeysParams {
    std::u32string shortcut_chars;
    double cost{1.0};
    int within_n_leftmost_cols{5};
};

struct SimilarLettersRating {
    double same_key_cost{0.0};
    double neighboring_cost{0.0};
    double same_column_cost{0.0};
    double symmetric_cost{0.0};
    std::vector<std::pair<char32_t, char32_t>> letter_pairs;
};

struct SimilarLettersParams {
    std::vector<SimilarLettersRating> ratings;
};

struct SimilarLetterGroupsParams {
    std::vector<std::pair<std::u32string, std::u32string>> letter_group_pairs;
};

struct FingerBalanceParams {
    FingerMatrix intended_loads{FingerMatrix::Zero()};
    Deviation deviation{Deviation::Squared};
};

struct HandDisbalanceParams {
    Deviation deviation{Deviation::Squared};
};

struct KeyCostsParams {};

struct RowLoadsParams {};

struct SymmetricHandswitchesParams {};

struct FingerRepeatsParams {
    Eigen::Matrix<double, 5, 1> finger_factors{Eigen::Matrix<double, 5, 1>::Ones()};
    double stretch_factor{1.0};
    double curl_factor{1.0};
    double lateral_factor{1.0};
    double same_key_offset{0.0};
};

using PositionPair = std::pair<MatrixPosition, MatrixPosition>;

struct ManualBigramPenaltyParams {
    bool add_mirrored{false};
    std::map<PositionPair, double> matrix_positions;
};

struct MovementPatternParams {
    FingerSwitchMatrix finger_switch_factor{FingerSwitchMatrix::Zero()};
    FingerMatrix finger_lengths{FingerMatrix::Zero()};
    double short_down_to_long_or_long_up_to_short_factor{1.0};
    double same_row_offset{0.0};
    double unbalancing_factor{0.0};
    double lateral_stretch_factor{0.0};
};

struct NoHandswitchAfterUnbalancingKeyParams {
    double unbalancing_after_unbalancing{0.0};
};

struct IrregularityParams {};

struct NoHandswitchInTrigramParams {
    double factor_with_direction_change{1.0};
    double factor_without_direction_change{0.0};
    double factor_same_key{0.0};
    double factor_contains_finger_repeat{0.0};
    double factor_same_key_start_end{0.0};
    double factor_contains_index{0.0};
};

struct SecondaryBigramsParams {
    double factor_no_handswitch{1.0};
    double factor_handswitch{1.0};
    std::vector<char32_t> initial_pause_indicators;
};

struct TrigramFingerRepeatsParams {
    double factor_lateral_movement{1.0};
};

// Trigrams touching any excluded key are not considered rolls.
struct RollFilter {
    bool exclude_thumbs{false};
    bool exclude_modifiers{false};
    std::vector<char32_t> exclude_chars;
    std::vector<int> exclude_rows;
};

struct TrigramRollsParams {
    double factor_inward{1.0};
    double factor_outward{1.0};
    RollFilter filter;
};

enum class RollDirection {
    Inward,
    Outward
};

struct OxeyRollsParams {
    RollDirection direction{RollDirection::Inward};
    RollFilter filter;
};

using MetricParams = std::variant<ShortcutKeysParams,
                                  SimilarLettersParams,
                                  SimilarLetterGroupsParams,
                                  FingerBalanceParams,
                                  HandDisbalanceParams,
                                  KeyCostsParams,
                                  RowLoadsParams,
                                  SymmetricHandswitchesParams,
                                  FingerRepeatsParams,
                                  ManualBigramPenaltyParams,
                                  MovementPatternParams,
                                  NoHandswitchAfterUnbalancingKeyParams,
                                  IrregularityParams,
                                  NoHandswitchInTrigramParams,
                                  SecondaryBigramsParams,
                                  TrigramFingerRepeatsParams,
                                  TrigramRollsParams,
                                  OxeyRollsParams>;

// Default-initialized parameter set of the right alternative for a metric kind.
[[nodiscard]] MetricParams default_params(MetricKind kind);

}  // namespace libkeyscore

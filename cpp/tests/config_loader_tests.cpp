#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <stdexcept>
#include <string>
#include <variant>

#include "libkeyscore/config_loader.hpp"

#ifndef KEYSCORE_TEST_DATA_DIR
#define KEYSCORE_TEST_DATA_DIR "data"
#endif

namespace {
const std::string kMinimalConfig = R"(
metrics:
  key_costs:
    weight: 20.0
    normalization:
      type: weight_found
  hand_disbalance:
    enabled: false
  finger_repeats:
    enabled: true
    weight: 1000
    normalization:
      type: fixed
      value: 2.5
    params:
      finger_factors: {Thumb: 1.2, Index: 0.8, Middle: 1.0, Ring: 1.1, Pinky: 1.2}
      stretch_factor: 1.2
      curl_factor: 1.1
      lateral_factor: 1.5
      same_key_offset: 0.5
)";

std::string single_metric(const std::string& name, const std::string& body) {
    return "metrics:\n  " + name + ":\n    weight: 1.0\n    normalization:\n      type: fixed\n" + body;
}
}  // namespace

TEST_CASE("Evaluation config keeps metrics in document order", "[config]") {
    const auto config = libkeyscore::parse_evaluation_config(kMinimalConfig);

    REQUIRE(config.metrics.size() == 3);
    REQUIRE(config.metrics[0].name == "key_costs");
    REQUIRE(config.metrics[1].name == "hand_disbalance");
    REQUIRE(config.metrics[2].name == "finger_repeats");

    const auto* key_costs = config.find("key_costs");
    REQUIRE(key_costs != nullptr);
    REQUIRE(key_costs->enabled);
    REQUIRE(key_costs->weight == Catch::Approx(20.0));
    REQUIRE(key_costs->normalization.type == libkeyscore::NormalizationType::WeightFound);
    REQUIRE(key_costs->normalization.value == Catch::Approx(1.0));

    const auto* disbalance = config.find("hand_disbalance");
    REQUIRE(disbalance != nullptr);
    REQUIRE_FALSE(disbalance->enabled);

    const auto* repeats = config.find("finger_repeats");
    REQUIRE(repeats->normalization.value == Catch::Approx(2.5));
    const auto& params = std::get<libkeyscore::FingerRepeatsParams>(repeats->params);
    REQUIRE(params.finger_factors(static_cast<Eigen::Index>(libkeyscore::finger_index(libkeyscore::Finger::Index))) ==
            Catch::Approx(0.8));
    REQUIRE(params.same_key_offset == Catch::Approx(0.5));

    REQUIRE(config.find("movement_pattern") == nullptr);
    REQUIRE(config.ngram_mapper.exclude_line_breaks);
    REQUIRE(config.ngram_mapper.split_modifiers.enabled);
}

TEST_CASE("Evaluation config reads the bundled configuration file", "[config]") {
    const auto config = libkeyscore::load_evaluation_config(std::string(KEYSCORE_TEST_DATA_DIR) + "/evaluation.yml");

    REQUIRE(config.metrics.size() == 14);
    REQUIRE(config.metrics.front().name == "shortcut_keys");

    const auto& shortcuts = std::get<libkeyscore::ShortcutKeysParams>(config.find("shortcut_keys")->params);
    REQUIRE(shortcuts.shortcut_chars == U"cvxz");
    REQUIRE(shortcuts.within_n_leftmost_cols == 5);

    const auto& groups = std::get<libkeyscore::SimilarLetterGroupsParams>(config.find("similar_letter_groups")->params);
    REQUIRE(groups.letter_group_pairs.size() == 1);
    REQUIRE(groups.letter_group_pairs[0].first == U"auo");
    REQUIRE(groups.letter_group_pairs[0].second == U"\u00E4\u00FC\u00F6");

    const auto& balance = std::get<libkeyscore::FingerBalanceParams>(config.find("finger_balance")->params);
    REQUIRE(balance.intended_loads(0, static_cast<Eigen::Index>(libkeyscore::finger_index(libkeyscore::Finger::Ring))) ==
            Catch::Approx(1.6));

    const auto& movement = std::get<libkeyscore::MovementPatternParams>(config.find("movement_pattern")->params);
    using libkeyscore::Finger;
    using libkeyscore::Hand;
    const auto from = static_cast<Eigen::Index>(libkeyscore::hand_finger_index(Hand::Left, Finger::Ring));
    const auto to = static_cast<Eigen::Index>(libkeyscore::hand_finger_index(Hand::Left, Finger::Index));
    REQUIRE(movement.finger_switch_factor(from, to) == Catch::Approx(0.1));
    REQUIRE(movement.finger_lengths(1, static_cast<Eigen::Index>(libkeyscore::finger_index(Finger::Middle))) ==
            Catch::Approx(3.0));
    REQUIRE(movement.lateral_stretch_factor == Catch::Approx(0.25));

    const auto& secondary = std::get<libkeyscore::SecondaryBigramsParams>(config.find("secondary_bigrams")->params);
    REQUIRE(secondary.initial_pause_indicators == std::vector<char32_t>{U',', U'.'});

    const auto* inward = config.find("oxey_inward_rolls");
    REQUIRE(inward->weight == Catch::Approx(-2.0));
    REQUIRE(inward->normalization.type == libkeyscore::NormalizationType::WeightAll);
    REQUIRE(inward->normalization.value == Catch::Approx(0.01));
    const auto& rolls = std::get<libkeyscore::OxeyRollsParams>(inward->params);
    REQUIRE(rolls.direction == libkeyscore::RollDirection::Inward);
    REQUIRE(rolls.filter.exclude_thumbs);
    REQUIRE(rolls.filter.exclude_chars == std::vector<char32_t>{U'\n'});
    REQUIRE(std::get<libkeyscore::OxeyRollsParams>(config.find("oxey_outward_rolls")->params).direction ==
            libkeyscore::RollDirection::Outward);

    REQUIRE_FALSE(config.ngram_mapper.increase_common_ngrams.enabled);
    REQUIRE(config.ngram_mapper.increase_common_ngrams.critical_fraction == Catch::Approx(0.001));
    REQUIRE(config.ngram_mapper.split_modifiers.same_key_mod_factor == Catch::Approx(0.03125));
}

TEST_CASE("Evaluation config reads position keyed penalties", "[config]") {
    const auto config = libkeyscore::parse_evaluation_config(single_metric("manual_bigram_penalty", R"(
    params:
      add_mirrored: true
      matrix_positions:
        [[3, 1], [2, 3]]: 2.5
        [[0, 0], [0, 2]]: 1.0
)"));
    const auto& params = std::get<libkeyscore::ManualBigramPenaltyParams>(config.metrics[0].params);
    REQUIRE(params.add_mirrored);
    REQUIRE(params.matrix_positions.size() == 2);
    const libkeyscore::PositionPair pair{libkeyscore::MatrixPosition{3, 1}, libkeyscore::MatrixPosition{2, 3}};
    REQUIRE(params.matrix_positions.at(pair) == Catch::Approx(2.5));
}

TEST_CASE("Evaluation config applies defaults to optional parameters", "[config]") {
    const auto config = libkeyscore::parse_evaluation_config(single_metric("trigram_rolls", R"(
    params:
      factor_inward: 0.5
      factor_outward: 0.25
)"));
    const auto& params = std::get<libkeyscore::TrigramRollsParams>(config.metrics[0].params);
    REQUIRE(params.factor_outward == Catch::Approx(0.25));
    REQUIRE_FALSE(params.filter.exclude_thumbs);
    REQUIRE(params.filter.exclude_chars.empty());
    REQUIRE(params.filter.exclude_rows.empty());

    const auto unbalancing = libkeyscore::parse_evaluation_config(single_metric("no_handswitch_after_unbalancing_key", ""));
    REQUIRE(std::get<libkeyscore::NoHandswitchAfterUnbalancingKeyParams>(unbalancing.metrics[0].params)
                .unbalancing_after_unbalancing == Catch::Approx(0.0));
}

TEST_CASE("Evaluation config rejects invalid documents", "[config]") {
    using Catch::Matchers::ContainsSubstring;

    SECTION("Unknown metric") {
        REQUIRE_THROWS_WITH(libkeyscore::parse_evaluation_config(single_metric("typing_speed", "")),
                            ContainsSubstring("Unknown metric: typing_speed"));
    }

    SECTION("Unknown normalization type") {
        const std::string yaml = R"(
metrics:
  key_costs:
    weight: 1.0
    normalization:
      type: median
)";
        REQUIRE_THROWS_WITH(libkeyscore::parse_evaluation_config(yaml), ContainsSubstring("Unknown normalization type"));
    }

    SECTION("Zero normalization value") {
        const std::string yaml = R"(
metrics:
  key_costs:
    weight: 1.0
    normalization:
      type: fixed
      value: 0.0
)";
        REQUIRE_THROWS_AS(libkeyscore::parse_evaluation_config(yaml), std::invalid_argument);
    }

    SECTION("Missing weight") {
        const std::string yaml = R"(
metrics:
  key_costs:
    normalization:
      type: fixed
)";
        REQUIRE_THROWS_WITH(libkeyscore::parse_evaluation_config(yaml), ContainsSubstring("weight is required"));
    }

    SECTION("Missing parameter names metric and parameter") {
        const auto yaml = single_metric("trigram_finger_repeats", "    params:\n      null: null\n");
        REQUIRE_THROWS_WITH(libkeyscore::parse_evaluation_config(yaml),
                            ContainsSubstring("trigram_finger_repeats") && ContainsSubstring("factor_lateral_movement"));
    }

    SECTION("Malformed parameter") {
        const auto yaml = single_metric("trigram_finger_repeats", "    params:\n      factor_lateral_movement: lots\n");
        REQUIRE_THROWS_WITH(libkeyscore::parse_evaluation_config(yaml), ContainsSubstring("factor_lateral_movement"));
    }

    SECTION("Unknown finger") {
        const auto yaml = single_metric("finger_balance", "    params:\n      intended_loads:\n        [Left, Toe]: 1.0\n");
        REQUIRE_THROWS_WITH(libkeyscore::parse_evaluation_config(yaml), ContainsSubstring("intended_loads"));
    }

    SECTION("Incomplete finger factors") {
        const auto yaml = single_metric("finger_repeats", R"(
    params:
      finger_factors: {Index: 0.8}
      stretch_factor: 1.2
      curl_factor: 1.1
      lateral_factor: 1.5
      same_key_offset: 0.5
)");
        REQUIRE_THROWS_WITH(libkeyscore::parse_evaluation_config(yaml), ContainsSubstring("finger_factors"));
    }

    SECTION("Letter groups of different length") {
        const auto yaml = single_metric("similar_letter_groups", "    params:\n      letter_group_pairs:\n        - [\"ab\", \"c\"]\n");
        REQUIRE_THROWS_AS(libkeyscore::parse_evaluation_config(yaml), std::invalid_argument);
    }

    SECTION("Duplicate metrics") {
        const std::string yaml = "metrics:\n  key_costs: {weight: 1, normalization: {type: fixed}}\n"
                                 "  key_costs: {weight: 2, normalization: {type: fixed}}\n";
        REQUIRE_THROWS_AS(libkeyscore::parse_evaluation_config(yaml), std::invalid_argument);
    }

    SECTION("Missing metrics map") {
        REQUIRE_THROWS_AS(libkeyscore::parse_evaluation_config("ngrams: {}\n"), std::invalid_argument);
    }

    SECTION("Broken YAML") {
        REQUIRE_THROWS_AS(libkeyscore::parse_evaluation_config("metrics: [unclosed\n"), std::invalid_argument);
    }

    SECTION("Negative modifier factor") {
        const std::string yaml = "metrics:\n  key_costs: {weight: 1, normalization: {type: fixed}}\n"
                                 "ngram_mapper:\n  split_modifiers:\n    same_key_mod_factor: -1\n";
        REQUIRE_THROWS_WITH(libkeyscore::parse_evaluation_config(yaml), ContainsSubstring("same_key_mod_factor"));
    }
}

TEST_CASE("Evaluation config reports unreadable files", "[config]") {
    REQUIRE_THROWS_AS(libkeyscore::load_evaluation_config("/nonexistent/evaluation.yml"), std::runtime_error);
}

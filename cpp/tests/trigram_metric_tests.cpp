#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <vector>

#include "libkeyscore/finger_repeats.hpp"
#include "libkeyscore/irregularity.hpp"
#include "libkeyscore/no_handswitch_in_trigram.hpp"
#include "libkeyscore/rolls.hpp"
#include "libkeyscore/secondary_bigrams.hpp"
#include "libkeyscore/trigram_finger_repeats.hpp"
#include "test_layouts.hpp"

using keyscore_test::layer_key;

namespace {
std::shared_ptr<const libkeyscore::BigramMetric> finger_repeats() {
    libkeyscore::FingerRepeatsParams params;
    params.finger_factors << 1.2, 0.8, 1.0, 1.1, 1.2;
    params.stretch_factor = 1.2;
    params.curl_factor = 1.1;
    params.lateral_factor = 1.5;
    params.same_key_offset = 0.5;
    return std::make_shared<libkeyscore::FingerRepeats>(params);
}

double trigram_cost(const libkeyscore::TrigramMetric& metric,
                    const libkeyscore::Layout& layout,
                    char32_t a,
                    char32_t b,
                    char32_t c) {
    return metric.individual_cost(layout, layer_key(layout, a), layer_key(layout, b), layer_key(layout, c));
}
}  // namespace

TEST_CASE("Irregularity multiplies the costs of both trigram halves", "[metrics][trigram]") {
    const auto layout = keyscore_test::make_qwerty_layout();

    SECTION("Unit weight") {
        const libkeyscore::Irregularity metric({{1.0, finger_repeats()}});
        REQUIRE(trigram_cost(metric, layout, U'f', U'r', U'f') == Catch::Approx(std::sqrt(0.96 * 0.88)));
        REQUIRE(trigram_cost(metric, layout, U'f', U'r', U'k') == 0.0);
        REQUIRE(trigram_cost(metric, layout, U'f', U'j', U'f') == 0.0);
    }

    SECTION("Bigram metrics enter with their weight") {
        const libkeyscore::Irregularity metric({{2.0, finger_repeats()}});
        REQUIRE(trigram_cost(metric, layout, U'f', U'r', U'f') == Catch::Approx(2.0 * std::sqrt(0.96 * 0.88)));
    }

    SECTION("Null bigram metrics") {
        std::vector<libkeyscore::WeightedBigramMetric> metrics{{1.0, nullptr}};
        REQUIRE_THROWS_AS(libkeyscore::Irregularity(metrics), std::invalid_argument);
    }
}

TEST_CASE("NoHandswitchInTrigram combines its factors", "[metrics][trigram]") {
    const auto layout = keyscore_test::make_qwerty_layout();
    libkeyscore::NoHandswitchInTrigramParams params;
    params.factor_with_direction_change = 2.0;
    params.factor_without_direction_change = 1.0;
    params.factor_same_key = 0.0;
    params.factor_contains_finger_repeat = 2.0;
    params.factor_same_key_start_end = 0.5;
    params.factor_contains_index = 0.5;
    const libkeyscore::NoHandswitchInTrigram metric(params);

    REQUIRE(trigram_cost(metric, layout, U'a', U's', U'd') == Catch::Approx(1.0));
    REQUIRE(trigram_cost(metric, layout, U's', U'f', U'd') == Catch::Approx(2.5));
    REQUIRE(trigram_cost(metric, layout, U'f', U'd', U'f') == Catch::Approx(3.0));
    REQUIRE(trigram_cost(metric, layout, U'f', U'r', U'd') == Catch::Approx(3.5));
    REQUIRE(trigram_cost(metric, layout, U'f', U'f', U'f') == 0.0);
    REQUIRE(trigram_cost(metric, layout, U'f', U'j', U'd') == 0.0);
}

TEST_CASE("SecondaryBigrams rates the outer keys of a trigram", "[metrics][trigram]") {
    const auto layout = keyscore_test::make_qwerty_layout();
    libkeyscore::SecondaryBigramsParams params;
    params.factor_no_handswitch = 0.7;
    params.factor_handswitch = 0.8;
    params.initial_pause_indicators = {U',', U'.'};
    const libkeyscore::SecondaryBigrams metric(params, {{1.0, finger_repeats()}});

    REQUIRE(trigram_cost(metric, layout, U'f', U'j', U'r') == Catch::Approx(0.8 * 0.96));
    REQUIRE(trigram_cost(metric, layout, U'f', U'd', U'r') == Catch::Approx(0.7 * 0.96));
    REQUIRE(metric.skips(layer_key(layout, U','), layer_key(layout, U' '), layer_key(layout, U'x')));
    REQUIRE_FALSE(metric.skips(layer_key(layout, U't'), layer_key(layout, U'h'), layer_key(layout, U'e')));
    REQUIRE_FALSE(metric.skips(layer_key(layout, U','), layer_key(layout, U'a'), layer_key(layout, U' ')));

    const auto corpus = keyscore_test::make_corpus({{U"a", 1.0}}, {}, {{U", x", 1.0}, {U"the", 1.0}, {U"fjr", 2.0}});
    const auto cost = metric.evaluate(layout, keyscore_test::map_plain(corpus, layout), false);
    REQUIRE(cost.cost == Catch::Approx(0.5 * 0.8 * 0.96));
    REQUIRE(cost.weight_found == Catch::Approx(0.5));
    REQUIRE(cost.weight_all == Catch::Approx(0.75));
}

TEST_CASE("TrigramFingerRepeats counts lateral moves", "[metrics][trigram]") {
    const auto layout = keyscore_test::make_qwerty_layout();
    libkeyscore::TrigramFingerRepeatsParams params;
    params.factor_lateral_movement = 1.5;
    const libkeyscore::TrigramFingerRepeats metric(params);

    REQUIRE(trigram_cost(metric, layout, U'r', U'f', U'v') == Catch::Approx(1.0));
    REQUIRE(trigram_cost(metric, layout, U'r', U'f', U'g') == Catch::Approx(1.5));
    REQUIRE(trigram_cost(metric, layout, U't', U'f', U'b') == Catch::Approx(2.25));
    REQUIRE(trigram_cost(metric, layout, U'f', U'r', U'f') == 0.0);
    REQUIRE(trigram_cost(metric, layout, U'f', U'j', U'r') == 0.0);
    REQUIRE(trigram_cost(metric, layout, U'f', U'd', U'r') == 0.0);
}

TEST_CASE("TrigramRolls rewards monotonic finger sequences", "[metrics][trigram]") {
    const auto layout = keyscore_test::make_qwerty_layout();
    libkeyscore::TrigramRollsParams params;
    params.factor_inward = 0.5;
    params.factor_outward = 0.25;

    SECTION("Directions") {
        const libkeyscore::TrigramRolls metric(params);
        REQUIRE(trigram_cost(metric, layout, U'a', U's', U'd') == Catch::Approx(0.5));
        REQUIRE(trigram_cost(metric, layout, U'd', U's', U'a') == Catch::Approx(0.25));
        REQUIRE(trigram_cost(metric, layout, U'a', U'd', U's') == 0.0);
        REQUIRE(trigram_cost(metric, layout, U'a', U's', U'j') == 0.0);
        REQUIRE(trigram_cost(metric, layout, U'f', U'r', U'd') == 0.0);
    }

    SECTION("Filtered keys") {
        params.filter.exclude_thumbs = true;
        params.filter.exclude_rows = {0};
        const libkeyscore::TrigramRolls metric(params);
        REQUIRE(metric.skips(layer_key(layout, U' '), layer_key(layout, U'j'), layer_key(layout, U'k')));
        REQUIRE(metric.skips(layer_key(layout, U'a'), layer_key(layout, U'w'), layer_key(layout, U'd')));
        REQUIRE_FALSE(metric.skips(layer_key(layout, U'a'), layer_key(layout, U's'), layer_key(layout, U'd')));

        const auto corpus = keyscore_test::make_corpus({{U"a", 1.0}}, {}, {{U"asd", 1.0}, {U" jk", 1.0}});
        const auto cost = metric.evaluate(layout, keyscore_test::map_plain(corpus, layout), false);
        REQUIRE(cost.cost == Catch::Approx(0.25));
        REQUIRE(cost.weight_all == Catch::Approx(0.5));
    }
}

TEST_CASE("OxeyRolls count same-hand pairs next to a handswitch", "[metrics][trigram]") {
    const auto layout = keyscore_test::make_qwerty_layout();
    libkeyscore::OxeyRollsParams params;
    params.filter.exclude_modifiers = true;
    params.filter.exclude_chars = {U'\n'};

    params.direction = libkeyscore::RollDirection::Inward;
    const libkeyscore::OxeyRolls inward(params);
    params.direction = libkeyscore::RollDirection::Outward;
    const libkeyscore::OxeyRolls outward(params);

    REQUIRE(inward.direction() == libkeyscore::RollDirection::Inward);
    REQUIRE(trigram_cost(inward, layout, U'a', U's', U'j') == 1.0);
    REQUIRE(trigram_cost(inward, layout, U'j', U'a', U's') == 1.0);
    REQUIRE(trigram_cost(inward, layout, U's', U'a', U'j') == 0.0);
    REQUIRE(trigram_cost(outward, layout, U's', U'a', U'j') == 1.0);
    REQUIRE(trigram_cost(outward, layout, U'a', U'j', U'k') == 1.0);
    REQUIRE(trigram_cost(inward, layout, U'a', U's', U'd') == 0.0);
    REQUIRE(trigram_cost(inward, layout, U'f', U'r', U'j') == 0.0);

    REQUIRE(inward.skips(layer_key(layout, U'l'), layer_key(layout, U'\n'), layer_key(layout, U'a')));
    REQUIRE(inward.skips(layer_key(layout, keyscore_test::kShift), layer_key(layout, U'k'), layer_key(layout, U'a')));
}

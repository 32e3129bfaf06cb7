#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <limits>
#include <stdexcept>
#include <vector>

#include "libkeyscore/layout.hpp"
#include "test_layouts.hpp"

using keyscore_test::kAlt;
using keyscore_test::kShift;

TEST_CASE("Layout maps symbols onto keys", "[layout]") {
    const auto layout = keyscore_test::make_qwerty_layout();

    REQUIRE(layout.key_count() == 34);
    REQUIRE(layout.layerkey_count() == 38);

    const auto* f = layout.key_of(U'f');
    REQUIRE(f != nullptr);
    REQUIRE(f->column == 3);
    REQUIRE(f->row == 1);
    REQUIRE(f->hand == libkeyscore::Hand::Left);
    REQUIRE(f->finger == libkeyscore::Finger::Index);
    REQUIRE(f->cost == Catch::Approx(1.0));

    REQUIRE(layout.key_of(U'X') == nullptr);
    REQUIRE_FALSE(layout.layerkey_index(U'X').has_value());
    REQUIRE(layout.key_of(U'\u00E4') == layout.key_of(U';'));
}

TEST_CASE("Layout places the symmetry axis in the central gap", "[layout]") {
    const auto layout = keyscore_test::make_qwerty_layout();
    REQUIRE(layout.symmetry_axis() == Catch::Approx(4.5));
}

TEST_CASE("Layout resolves modifier layers", "[layout]") {
    const auto layout = keyscore_test::make_qwerty_layout();
    REQUIRE(layout.has_modifier_layers());

    const auto umlaut = layout.layerkey_index(U'\u00E4').value();
    const auto semicolon = layout.layerkey_index(U';').value();
    const auto shift = layout.layerkey_index(kShift).value();
    const auto alt = layout.layerkey_index(kAlt).value();

    REQUIRE(layout.base_layerkey(umlaut) == semicolon);
    REQUIRE(layout.base_layerkey(semicolon) == semicolon);
    REQUIRE(layout.layerkey(umlaut).layer == 1);
    REQUIRE(layout.layerkey(umlaut).modifiers == std::vector<std::size_t>{shift});

    const auto& euro = keyscore_test::layer_key(layout, U'\u20AC');
    REQUIRE(euro.modifiers == std::vector<std::size_t>{shift, alt});

    REQUIRE(layout.layerkey(shift).is_modifier);
    REQUIRE(layout.layerkey(alt).is_modifier);
    REQUIRE_FALSE(keyscore_test::layer_key(layout, U'a').is_modifier);
}

TEST_CASE("Layout accessors reject out of range indices", "[layout]") {
    const auto layout = keyscore_test::make_qwerty_layout();
    REQUIRE_THROWS_AS(layout.key(34), std::out_of_range);
    REQUIRE_THROWS_AS(layout.layerkey(38), std::out_of_range);
    REQUIRE_THROWS_AS(layout.base_layerkey(38), std::out_of_range);
}

TEST_CASE("LayoutBuilder validates placements", "[layout]") {
    using libkeyscore::Finger;
    using libkeyscore::Hand;

    libkeyscore::LayoutBuilder builder;
    const auto a = builder.add_key(0, 1, Hand::Left, Finger::Pinky);
    const auto b = builder.add_key(9, 1, Hand::Right, Finger::Pinky);

    SECTION("Duplicate symbols") {
        builder.place_symbol(U'a', a);
        REQUIRE_THROWS_AS(builder.place_symbol(U'a', b), std::invalid_argument);
    }

    SECTION("Two symbols on one key and layer") {
        builder.place_symbol(U'a', a);
        builder.place_symbol(U'b', a);
        REQUIRE_THROWS_AS(builder.build(), std::invalid_argument);
    }

    SECTION("Higher layers require modifiers") {
        REQUIRE_THROWS_AS(builder.place_symbol(U'A', a, 1), std::invalid_argument);
    }

    SECTION("Unknown modifiers") {
        builder.place_symbol(U'a', a);
        builder.place_symbol(U'A', a, 1, {kShift});
        REQUIRE_THROWS_AS(builder.build(), std::invalid_argument);
    }

    SECTION("Symbols cannot modify themselves") {
        REQUIRE_THROWS_AS(builder.place_symbol(kShift, a, 1, {kShift}), std::invalid_argument);
    }

    SECTION("Layered symbols need a base symbol on their key") {
        builder.place_symbol(kShift, b);
        builder.place_symbol(U'A', a, 1, {kShift});
        REQUIRE_THROWS_AS(builder.build(), std::invalid_argument);
    }

    SECTION("Unknown keys") {
        REQUIRE_THROWS_AS(builder.place_symbol(U'a', 7), std::invalid_argument);
    }

    SECTION("Empty layouts") {
        REQUIRE_THROWS_AS(builder.build(), std::invalid_argument);
    }
}

TEST_CASE("LayoutBuilder rejects invalid key costs and axes", "[layout]") {
    libkeyscore::LayoutBuilder builder;
    REQUIRE_THROWS_AS(builder.add_key(0, 0, libkeyscore::Hand::Left, libkeyscore::Finger::Index, -1.0),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(builder.set_symmetry_axis(std::numeric_limits<double>::infinity()), std::invalid_argument);
}

TEST_CASE("LayoutBuilder honours an explicit symmetry axis", "[layout]") {
    libkeyscore::LayoutBuilder builder;
    const auto key = builder.add_key(0, 0, libkeyscore::Hand::Left, libkeyscore::Finger::Index);
    builder.place_symbol(U'a', key);
    builder.set_symmetry_axis(7.0);
    REQUIRE(builder.build().symmetry_axis() == Catch::Approx(7.0));
}

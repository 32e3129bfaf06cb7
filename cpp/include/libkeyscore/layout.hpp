#pragma once

#include "libkeyscore/key_types.hpp"

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

namespace libkeyscore {

class LayoutBuilder;

/**
 * Immutable mapping of symbols onto physical keys.
 *
 * Every symbol sits on exactly one key and every key hosts at most one symbol per layer.
 * Symbols on higher layers list the modifier layer keys that must be held to reach them;
 * base_layerkey() returns the layer-0 symbol of the same physical key.
 */
class Layout {
public:
    [[nodiscard]] std::size_t key_count() const noexcept { return keys_.size(); }

    [[nodiscard]] std::size_t layerkey_count() const noexcept { return layerkeys_.size(); }

    [[nodiscard]] const Key& key(std::size_t index) const;

    [[nodiscard]] const LayerKey& layerkey(std::size_t index) const;

    [[nodiscard]] const std::vector<LayerKey>& layerkeys() const noexcept { return layerkeys_; }

    [[nodiscard]] const Key* key_of(char32_t symbol) const noexcept;

    [[nodiscard]] std::optional<std::size_t> layerkey_index(char32_t symbol) const noexcept;

    [[nodiscard]] std::size_t base_layerkey(std::size_t index) const;

    [[nodiscard]] bool has_modifier_layers() const noexcept { return has_modifier_layers_; }

    [[nodiscard]] double symmetry_axis() const noexcept { return symmetry_axis_; }

private:
    friend class LayoutBuilder;

    Layout() = default;

    std::vector<Key> keys_;
    std::vector<LayerKey> layerkeys_;
    std::vector<std::size_t> base_layerkeys_;
    std::unordered_map<char32_t, std::size_t> symbol_index_;
    bool has_modifier_layers_{false};
    double symmetry_axis_{0.0};
};

class LayoutBuilder {
public:
    LayoutBuilder() = default;

    std::size_t add_key(int column, int row, Hand hand, Finger finger, double cost = 0.0, bool unbalancing = false);

    void place_symbol(char32_t symbol, std::size_t key, std::size_t layer = 0, std::vector<char32_t> modifiers = {});

    // Overrides the default axis, the middle of the gap between the two hands' non-thumb keys.
    void set_symmetry_axis(double axis);

    [[nodiscard]] Layout build() const;

private:
    struct Placement {
        char32_t symbol;
        std::size_t key;
        std::size_t layer;
        std::vector<char32_t> modifiers;
    };

    [[nodiscard]] double default_symmetry_axis() const;

    std::vector<Key> keys_;
    std::vector<Placement> placements_;
    std::unordered_map<char32_t, std::size_t> placement_index_;
    std::optional<double> symmetry_axis_;
};

}  // namespace libkeyscore

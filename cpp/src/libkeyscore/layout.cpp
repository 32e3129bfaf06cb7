#include "libkeyscore/layout.hpp"

#include "libkeyscore/unicode.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>

namespace libkeyscore {

const Key& Layout::key(std::size_t index) const {
    if (index >= keys_.size()) {
        throw std::out_of_range("key index out of range: " + std::to_string(index));
    }
    return keys_[index];
}

const LayerKey& Layout::layerkey(std::size_t index) const {
    if (index >= layerkeys_.size()) {
        throw std::out_of_range("layer key index out of range: " + std::to_string(index));
    }
    return layerkeys_[index];
}

const Key* Layout::key_of(char32_t symbol) const noexcept {
    auto it = symbol_index_.find(symbol);
    if (it == symbol_index_.end()) {
        return nullptr;
    }
    return &layerkeys_[it->second].key;
}

std::optional<std::size_t> Layout::layerkey_index(char32_t symbol) const noexcept {
    auto it = symbol_index_.find(symbol);
    if (it == symbol_index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t Layout::base_layerkey(std::size_t index) const {
    if (index >= base_layerkeys_.size()) {
        throw std::out_of_range("layer key index out of range: " + std::to_string(index));
    }
    return base_layerkeys_[index];
}

std::size_t LayoutBuilder::add_key(int column, int row, Hand hand, Finger finger, double cost, bool unbalancing) {
    if (!(cost >= 0.0) || !std::isfinite(cost)) {
        throw std::invalid_argument("key cost must be finite and non-negative: " + std::to_string(cost));
    }
    Key key;
    key.index = keys_.size();
    key.column = column;
    key.row = row;
    key.hand = hand;
    key.finger = finger;
    key.cost = cost;
    key.unbalancing = unbalancing;
    keys_.push_back(key);
    return key.index;
}

void LayoutBuilder::place_symbol(char32_t symbol, std::size_t key, std::size_t layer, std::vector<char32_t> modifiers) {
    if (key >= keys_.size()) {
        throw std::invalid_argument("symbol placed on unknown key: " + std::to_string(key));
    }
    if (placement_index_.contains(symbol)) {
        throw std::invalid_argument("duplicate symbol in layout: " + display_symbol(symbol));
    }
    if (layer > 0 && modifiers.empty()) {
        throw std::invalid_argument("symbol on layer " + std::to_string(layer) + " requires modifiers: " + display_symbol(symbol));
    }
    if (std::find(modifiers.begin(), modifiers.end(), symbol) != modifiers.end()) {
        throw std::invalid_argument("symbol cannot be its own modifier: " + display_symbol(symbol));
    }
    placement_index_.emplace(symbol, placements_.size());
    placements_.push_back(Placement{symbol, key, layer, std::move(modifiers)});
}

void LayoutBuilder::set_symmetry_axis(double axis) {
    if (!std::isfinite(axis)) {
        throw std::invalid_argument("symmetry axis must be finite");
    }
    symmetry_axis_ = axis;
}

double LayoutBuilder::default_symmetry_axis() const {
    int left_inner = std::numeric_limits<int>::min();
    int right_inner = std::numeric_limits<int>::max();
    int min_column = std::numeric_limits<int>::max();
    int max_column = std::numeric_limits<int>::min();
    for (const auto& key : keys_) {
        min_column = std::min(min_column, key.column);
        max_column = std::max(max_column, key.column);
        if (key.finger == Finger::Thumb) {
            continue;
        }
        if (key.hand == Hand::Left) {
            left_inner = std::max(left_inner, key.column);
        } else {
            right_inner = std::min(right_inner, key.column);
        }
    }
    if (left_inner != std::numeric_limits<int>::min() && right_inner != std::numeric_limits<int>::max()) {
        return 0.5 * (static_cast<double>(left_inner) + static_cast<double>(right_inner));
    }
    return 0.5 * (static_cast<double>(min_column) + static_cast<double>(max_column));
}

Layout LayoutBuilder::build() const {
    if (placements_.empty()) {
        throw std::invalid_argument("layout requires at least one symbol");
    }

    Layout layout;
    layout.keys_ = keys_;
    layout.layerkeys_.reserve(placements_.size());

    std::map<std::pair<std::size_t, std::size_t>, std::size_t> slots;
    for (std::size_t i = 0; i < placements_.size(); ++i) {
        const auto& placement = placements_[i];
        auto [it, inserted] = slots.emplace(std::make_pair(placement.key, placement.layer), i);
        if (!inserted) {
            throw std::invalid_argument("key " + std::to_string(placement.key) + " hosts two symbols on layer " +
                                        std::to_string(placement.layer) + ": " + display_symbol(placement.symbol));
        }

        LayerKey layerkey;
        layerkey.symbol = placement.symbol;
        layerkey.layer = placement.layer;
        layerkey.key = keys_[placement.key];
        layout.layerkeys_.push_back(std::move(layerkey));
        layout.symbol_index_.emplace(placement.symbol, i);
    }

    layout.base_layerkeys_.resize(placements_.size());
    for (std::size_t i = 0; i < placements_.size(); ++i) {
        const auto& placement = placements_[i];
        auto& layerkey = layout.layerkeys_[i];

        for (char32_t modifier : placement.modifiers) {
            auto it = placement_index_.find(modifier);
            if (it == placement_index_.end()) {
                throw std::invalid_argument("unknown modifier " + display_symbol(modifier) + " for symbol " +
                                            display_symbol(placement.symbol));
            }
            layerkey.modifiers.push_back(it->second);
            layout.layerkeys_[it->second].is_modifier = true;
        }
        if (!layerkey.modifiers.empty()) {
            layout.has_modifier_layers_ = true;
        }

        if (placement.layer == 0) {
            layout.base_layerkeys_[i] = i;
            continue;
        }
        auto base = slots.find(std::make_pair(placement.key, std::size_t{0}));
        if (base == slots.end()) {
            throw std::invalid_argument("symbol " + display_symbol(placement.symbol) + " has no base-layer symbol on its key");
        }
        layout.base_layerkeys_[i] = base->second;
    }

    layout.symmetry_axis_ = symmetry_axis_.value_or(default_symmetry_axis());
    return layout;
}

}  // namespace libkeyscore

#pragma once

#include "libkeyscore/metric.hpp"

namespace libkeyscore {

// Shortcut symbols are expected within the leftmost columns of the keyboard.
class ShortcutKeys final : public UnigramMetric {
public:
    explicit ShortcutKeys(ShortcutKeysParams params);

    [[nodiscard]] MetricCost evaluate(const Layout& layout, const MappedNgrams& ngrams, bool parallel) const override;

private:
    ShortcutKeysParams params_;
};

}  // namespace libkeyscore

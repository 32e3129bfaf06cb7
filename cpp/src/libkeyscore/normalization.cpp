#include "libkeyscore/normalization.hpp"

#include <stdexcept>

namespace libkeyscore {

double normalize_cost(const Normalization& normalization, const MetricCost& cost) {
    if (normalization.value == 0.0) {
        throw std::invalid_argument("normalization value must not be zero");
    }
    switch (normalization.type) {
        case NormalizationType::Fixed:
            return cost.cost / normalization.value;
        case NormalizationType::WeightFound:
            if (cost.weight_found == 0.0) {
                return 0.0;
            }
            return cost.cost / cost.weight_found / normalization.value;
        case NormalizationType::WeightAll:
            if (cost.weight_all == 0.0) {
                return 0.0;
            }
            return cost.cost / cost.weight_all / normalization.value;
    }
    throw std::invalid_argument("Unknown normalization type");
}

}  // namespace libkeyscore

#include "libkeyscore/row_loads.hpp"

#include <iomanip>
#include <map>
#include <sstream>
#include <string>
#include <utility>

namespace libkeyscore {

MetricCost RowLoads::evaluate(const Layout& layout, const MappedNgrams& ngrams, bool /*parallel*/) const {
    std::map<int, double> rows;
    double total = 0.0;
    for (const auto& unigram : ngrams.unigrams) {
        rows[layout.layerkeys()[unigram.keys[0]].key.row] += unigram.weight;
        total += unigram.weight;
    }

    MetricCost result;
    result.weight_all = total;
    result.weight_found = total;

    std::ostringstream oss;
    oss << "Row loads %:" << std::fixed << std::setprecision(1);
    for (const auto& [row, load] : rows) {
        oss << ' ' << row << ": " << (total > 0.0 ? 100.0 * load / total : 0.0) << ';';
    }
    std::string message = oss.str();
    if (!rows.empty()) {
        message.pop_back();
    }
    result.message = std::move(message);
    return result;
}

}  // namespace libkeyscore

#include "GreedyAllocator.h"

#include <limits>
#include <stdexcept>

namespace taxisim {

std::vector<int> allocateGreedy(int num_drivers,
                                const std::vector<double>& revenues,
                                CongestionModel model,
                                double alpha) {
    if (num_drivers < 0) {
        throw std::invalid_argument("num_drivers must be non-negative");
    }
    validateCongestionParams(model, alpha);

    std::vector<int> counts(revenues.size(), 0);
    if (num_drivers == 0) {
        return counts;
    }
    if (revenues.empty()) {
        throw std::invalid_argument("cannot allocate drivers over zero zones");
    }

    // O(num_drivers * K). Strict '>' keeps the first (lowest-index) maximum.
    for (int unit = 0; unit < num_drivers; ++unit) {
        std::size_t best_k = 0;
        double best_gain = -std::numeric_limits<double>::infinity();
        for (std::size_t k = 0; k < revenues.size(); ++k) {
            const double gain = marginalGain(model, counts[k], revenues[k], alpha);
            if (gain > best_gain) {
                best_gain = gain;
                best_k = k;
            }
        }
        ++counts[best_k];
    }
    return counts;
}

} // namespace taxisim

#include "AssignmentPolicy.h"

#include "GreedyAllocator.h"

#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace taxisim {

std::vector<int> assignByHoursPriority(const std::vector<Driver>& active,
                                       const std::vector<int>& counts) {
    std::vector<int> slots;
    slots.reserve(active.size());
    for (std::size_t k = 0; k < counts.size(); ++k) {
        if (counts[k] < 0) {
            throw std::invalid_argument("negative slot count in zone " + std::to_string(k));
        }
        slots.insert(slots.end(), static_cast<std::size_t>(counts[k]), static_cast<int>(k));
    }
    if (slots.size() != active.size()) {
        throw std::invalid_argument("allocation covers " + std::to_string(slots.size()) +
                                    " drivers but " + std::to_string(active.size()) + " are active");
    }

    std::vector<std::size_t> order(active.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return active[a].hours_left > active[b].hours_left;
    });

    std::vector<int> targets(active.size(), 0);
    for (std::size_t rank = 0; rank < order.size(); ++rank) {
        targets[order[rank]] = slots[rank];
    }
    return targets;
}

std::vector<int> GreedyAssignmentPolicy::assignTargets(const std::vector<Driver>& active,
                                                       const std::vector<double>& revenues,
                                                       CongestionModel model,
                                                       double alpha,
                                                       std::mt19937_64& /*rng*/) const {
    const std::vector<int> counts =
        allocateGreedy(static_cast<int>(active.size()), revenues, model, alpha);
    return assignByHoursPriority(active, counts);
}

std::vector<int> RandomAssignmentPolicy::assignTargets(const std::vector<Driver>& active,
                                                       const std::vector<double>& revenues,
                                                       CongestionModel /*model*/,
                                                       double /*alpha*/,
                                                       std::mt19937_64& rng) const {
    std::vector<int> targets;
    if (active.empty()) {
        return targets;
    }
    if (revenues.empty()) {
        throw std::invalid_argument("cannot assign drivers over zero zones");
    }

    std::uniform_int_distribution<int> zone_dist(0, static_cast<int>(revenues.size()) - 1);
    targets.reserve(active.size());
    for (std::size_t i = 0; i < active.size(); ++i) {
        targets.push_back(zone_dist(rng));
    }
    return targets;
}

} // namespace taxisim

#include "StrategyState.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace taxisim {

StrategyState::StrategyState(std::unique_ptr<AssignmentPolicy> policy)
    : policy_(std::move(policy)) {
    if (!policy_) {
        throw std::invalid_argument("StrategyState requires an assignment policy");
    }
}

void StrategyState::reset(const std::vector<Driver>& drivers) {
    drivers_ = drivers;
    total_revenue_ = 0.0;
    slots_ = 0;
}

int StrategyState::activeCount() const {
    return static_cast<int>(std::count_if(drivers_.begin(), drivers_.end(),
                                          [](const Driver& d) { return d.isActive(); }));
}

StrategySlotRecord StrategyState::step(const std::vector<double>& revenues,
                                       CongestionModel model,
                                       double alpha,
                                       std::mt19937_64& rng,
                                       double dt_h) {
    StrategySlotRecord rec;
    rec.zones_before.reserve(drivers_.size());
    for (const Driver& d : drivers_) {
        rec.zones_before.push_back(d.cluster);
    }
    rec.zones_after = rec.zones_before;

    // 1) active subset (indices into drivers_, natural order)
    std::vector<std::size_t> active_idx;
    std::vector<Driver> active;
    for (std::size_t i = 0; i < drivers_.size(); ++i) {
        if (drivers_[i].isActive()) {
            active_idx.push_back(i);
            active.push_back(drivers_[i]);
        }
    }
    rec.active_count = static_cast<int>(active.size());

    if (active.empty()) {
        rec.inactive_after = static_cast<int>(drivers_.size());
        ++slots_;
        return rec;
    }

    // 2) targets, optimised under the same model/alpha the slot is scored with
    const std::vector<int> targets = policy_->assignTargets(active, revenues, model, alpha, rng);
    if (targets.size() != active.size()) {
        throw std::invalid_argument(std::string(policy_->name()) +
                                    " policy returned a target list of the wrong length");
    }

    // 3) stayers / movers
    const int num_zones = static_cast<int>(revenues.size());
    std::vector<int> stayer_zones;
    std::vector<std::pair<std::size_t, int>> moves;
    for (std::size_t j = 0; j < active.size(); ++j) {
        const int tgt = targets[j];
        if (tgt < 0 || tgt >= num_zones) {
            throw std::invalid_argument(std::string(policy_->name()) + " policy targeted zone " +
                                        std::to_string(tgt) + " outside [0, " +
                                        std::to_string(num_zones) + ")");
        }
        if (tgt == active[j].cluster) {
            stayer_zones.push_back(tgt);
        } else {
            moves.emplace_back(active_idx[j], tgt);
        }
    }
    rec.stayer_count = static_cast<int>(stayer_zones.size());
    rec.mover_count = static_cast<int>(moves.size());

    // 4) only stayers earn
    validateCongestionParams(model, alpha);
    if (!stayer_zones.empty()) {
        rec.slot_revenue = computeMacro(zoneCounts(stayer_zones, num_zones), revenues, model, alpha);
    }

    // Nothing below throws; the slot is committed from here on.
    total_revenue_ += rec.slot_revenue;
    ++slots_;

    // 5) movers relocate; they are eligible to earn from the next slot
    for (const auto& mv : moves) {
        drivers_[mv.first].cluster = mv.second;
        rec.zones_after[mv.first] = mv.second;
    }

    // 6) burn shift time
    for (std::size_t i : active_idx) {
        drivers_[i].hours_left = std::max(0.0, drivers_[i].hours_left - dt_h);
    }

    rec.inactive_after = static_cast<int>(drivers_.size()) - activeCount();
    return rec;
}

} // namespace taxisim

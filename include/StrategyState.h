#pragma once

#include "AssignmentPolicy.h"
#include "CongestionModel.h"

#include <memory>
#include <random>
#include <vector>

namespace taxisim {

// Fixed slot length (hours). A move between zones takes exactly one slot.
constexpr double kSlotDuration_h = 0.5;

// One strategy's view of one slot.
struct StrategySlotRecord {
    // Zone of every driver (active or not) before / after the decision.
    // Movers already show their target in zones_after; they arrive next slot.
    std::vector<int> zones_before;
    std::vector<int> zones_after;

    double slot_revenue = 0.0;

    int active_count = 0;    // active at slot start
    int stayer_count = 0;
    int mover_count = 0;
    int inactive_after = 0;  // hours_left == 0 after the slot
};

// ============================================================
// Strategy state machine
//
// Owns one driver population and advances it one slot at a time:
//   1. select active drivers (none -> zero revenue, no change)
//   2. targets from the injected AssignmentPolicy
//   3. split into stayers (target == zone) and movers
//   4. slot revenue = computeMacro over the stayers' zones only
//   5. movers take their target zone
//   6. every active driver loses dt hours, floored at 0
// ============================================================
class StrategyState {
public:
    explicit StrategyState(std::unique_ptr<AssignmentPolicy> policy);

    StrategyState(StrategyState&&) = default;
    StrategyState& operator=(StrategyState&&) = default;
    StrategyState(const StrategyState&) = delete;
    StrategyState& operator=(const StrategyState&) = delete;

    // Takes an independent copy of the population and clears the total.
    void reset(const std::vector<Driver>& drivers);

    // model/alpha drive both the policy's targets and the slot's revenue.
    // Throws std::invalid_argument if the policy returns a malformed
    // assignment or the congestion parameters are unusable; the state is
    // left unchanged in that case.
    StrategySlotRecord step(const std::vector<double>& revenues,
                            CongestionModel model,
                            double alpha,
                            std::mt19937_64& rng,
                            double dt_h = kSlotDuration_h);

    const std::vector<Driver>& drivers() const { return drivers_; }
    const AssignmentPolicy& policy() const { return *policy_; }
    const char* name() const { return policy_->name(); }

    double totalRevenue() const noexcept { return total_revenue_; }
    int activeCount() const;
    int slotsStepped() const noexcept { return slots_; }

private:
    std::unique_ptr<AssignmentPolicy> policy_;
    std::vector<Driver> drivers_;
    double total_revenue_ = 0.0;
    int slots_ = 0;
};

} // namespace taxisim

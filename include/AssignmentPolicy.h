#pragma once

#include "CongestionModel.h"

#include <random>
#include <vector>

namespace taxisim {

// Plain per-driver state, owned by exactly one StrategyState.
// hours_left == 0 is terminal: no further assignment, movement or revenue.
struct Driver {
    int cluster = 0;
    double hours_left = 0.0;

    bool isActive() const noexcept { return hours_left > 0.0; }
};

// Expands counts into a flat slot list (zone 0 repeated counts[0] times, then
// zone 1, ...) and hands slot i to the i-th driver ranked by hours_left
// descending; equal hours_left keep their input order.
//
// Returns one target zone per entry of `active`, in input order.
// Throws std::invalid_argument if sum(counts) != active.size().
std::vector<int> assignByHoursPriority(const std::vector<Driver>& active,
                                       const std::vector<int>& counts);

// ============================================================
// Strategy seam: maps the active drivers of one slot to target zones.
// ============================================================
class AssignmentPolicy {
public:
    virtual ~AssignmentPolicy() = default;

    virtual const char* name() const = 0;

    // Must return exactly active.size() zone ids in [0, revenues.size()).
    // model/alpha are the ones the slot is scored under.
    virtual std::vector<int> assignTargets(const std::vector<Driver>& active,
                                           const std::vector<double>& revenues,
                                           CongestionModel model,
                                           double alpha,
                                           std::mt19937_64& rng) const = 0;
};

// Greedy macro-revenue counts, then hours-left priority. Draws nothing from rng.
// Throws std::invalid_argument if alpha is unusable for the model.
class GreedyAssignmentPolicy final : public AssignmentPolicy {
public:
    const char* name() const override { return "allocator"; }

    std::vector<int> assignTargets(const std::vector<Driver>& active,
                                   const std::vector<double>& revenues,
                                   CongestionModel model,
                                   double alpha,
                                   std::mt19937_64& rng) const override;
};

// Uniform zone per active driver, drawn in input order.
class RandomAssignmentPolicy final : public AssignmentPolicy {
public:
    const char* name() const override { return "baseline"; }

    std::vector<int> assignTargets(const std::vector<Driver>& active,
                                   const std::vector<double>& revenues,
                                   CongestionModel model,
                                   double alpha,
                                   std::mt19937_64& rng) const override;
};

} // namespace taxisim

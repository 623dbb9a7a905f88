#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "CongestionModel.h"
#include "StrategyState.h"
#include "../data/revenue_table.h"

namespace taxisim {

using data::RevenueContext;

// ============================================================
// Scenario contract for one trial (allocator vs. random baseline).
// ============================================================
struct ScenarioConfig {
    // 0 = take the zone count from the revenue table.
    int num_zones = 0;
    int num_drivers = 30;
    double horizon_h = 6.0;

    CongestionModel model = CongestionModel::Saturation;
    double alpha = 0.6;

    // Negative = drawn per trial (day uniform in [0,7), time uniform in [0,24)).
    int start_day = -1;
    double start_time_h = -1.0;
    std::string weather = "clear";

    // Initial shift length per driver: uniform integer hours in [min, max].
    int min_shift_h = 1;
    int max_shift_h = 8;

    // Keep per-slot records (before/after zones) for inspection and animation.
    bool record_trace = false;
};

struct TrialOutcome {
    double allocator_total = 0.0;
    double baseline_total = 0.0;

    double diff() const noexcept { return allocator_total - baseline_total; }
};

// Both strategies for one slot. They always share context and revenues.
struct SlotRecord {
    int slot = 0;
    RevenueContext context{};
    std::vector<double> revenues;
    StrategySlotRecord allocator;
    StrategySlotRecord baseline;
};

struct Observation {
    int slot = 0;           // slots completed
    int total_slots = 0;
    RevenueContext context{};

    double allocator_total = 0.0;
    double baseline_total = 0.0;
    int allocator_active = 0;
    int baseline_active = 0;
    int num_drivers = 0;

    bool concluded = false;
};

// Independent stream for trial `trial_index` of a run seeded with `base_seed`.
// Distinct indices never share draws, so trials may run in any order.
std::mt19937_64 makeTrialRng(std::uint64_t base_seed, std::uint64_t trial_index);

// ceil(horizon_h / kSlotDuration_h); 0 for a non-positive horizon, saturating
// at INT_MAX.
int slotCountForHorizon(double horizon_h);

// Longest horizon whose slot count still fits an int.
double maxHorizonHours();

// Throws std::invalid_argument for an unusable scenario.
void validateScenario(const ScenarioConfig& cfg, int num_zones);

// ============================================================
// Two-strategy simulation over one horizon.
//
// reset() draws the start context (if not fixed) and one initial population,
// then hands each strategy its own copy. Every step() looks up a single
// revenue vector for the shared context, advances the allocator, then the
// baseline, then the clock:
//   time = (time + dt) mod 24, day = (day + 1) mod 7 when time wraps.
// ============================================================
class Simulation {
public:
    // The table must outlive the simulation; it is only read.
    explicit Simulation(const data::RevenueTable& table);

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;
    Simulation(Simulation&&) = delete;
    Simulation& operator=(Simulation&&) = delete;

    // Takes ownership of the trial's random stream.
    // Throws std::invalid_argument for an unusable scenario.
    void reset(const ScenarioConfig& cfg, std::mt19937_64 rng);

    // No-op once concluded.
    void step();

    // Runs the remaining slots and returns the totals.
    TrialOutcome runToCompletion();

    // Side-effect free.
    Observation observe() const;
    TrialOutcome outcome() const;

    bool isConcluded() const noexcept { return slot_ >= total_slots_; }
    int slotIndex() const noexcept { return slot_; }
    int totalSlots() const noexcept { return total_slots_; }
    int numZones() const noexcept { return num_zones_; }
    const RevenueContext& context() const noexcept { return ctx_; }
    const ScenarioConfig& config() const noexcept { return cfg_; }

    const StrategyState& allocator() const { return allocator_; }
    const StrategyState& baseline() const { return baseline_; }
    const std::vector<Driver>& initialDrivers() const { return initial_drivers_; }

    // Empty unless cfg.record_trace was set.
    const std::vector<SlotRecord>& trace() const { return trace_; }

private:
    void advanceClock();

    const data::RevenueTable& table_;
    ScenarioConfig cfg_{};
    std::mt19937_64 rng_;

    StrategyState allocator_;
    StrategyState baseline_;
    std::vector<Driver> initial_drivers_;

    RevenueContext ctx_{};
    int num_zones_ = 0;
    int slot_ = 0;
    int total_slots_ = 0;

    std::vector<SlotRecord> trace_;
};

} // namespace taxisim

// Simulation.cpp
// Notes:
// - One random stream per trial: start context first, then the population
//   (zone, shift) driver by driver, then the baseline's per-slot draws.
// - The allocator policy never touches the stream, so the baseline sees the
//   same draws whether or not the allocator runs first.

#include "Simulation.h"

#include <cmath>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace taxisim {

namespace {

constexpr double kHoursPerDay = 24.0;
constexpr int kDaysPerWeek = 7;

// A tiny number for guarding slot-count rounding (6.0 / 0.5 must be 12, not 13).
constexpr double kEps = 1e-9;

} // namespace

std::mt19937_64 makeTrialRng(std::uint64_t base_seed, std::uint64_t trial_index) {
    std::seed_seq seq{
        static_cast<std::uint32_t>(base_seed & 0xFFFFFFFFu),
        static_cast<std::uint32_t>(base_seed >> 32),
        static_cast<std::uint32_t>(trial_index & 0xFFFFFFFFu),
        static_cast<std::uint32_t>(trial_index >> 32),
    };
    return std::mt19937_64(seq);
}

int slotCountForHorizon(double horizon_h) {
    if (!std::isfinite(horizon_h) || horizon_h <= 0.0) return 0;
    const double slots = std::ceil(horizon_h / kSlotDuration_h - kEps);
    if (slots >= static_cast<double>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(slots);
}

double maxHorizonHours() {
    return static_cast<double>(std::numeric_limits<int>::max() - 1) * kSlotDuration_h;
}

void validateScenario(const ScenarioConfig& cfg, int num_zones) {
    std::ostringstream err;
    if (num_zones <= 0) {
        err << "scenario needs at least one zone (got " << num_zones << ")";
    } else if (cfg.num_drivers < 0) {
        err << "num_drivers must be non-negative (got " << cfg.num_drivers << ")";
    } else if (!std::isfinite(cfg.horizon_h) || cfg.horizon_h <= 0.0) {
        err << "horizon_h must be positive (got " << cfg.horizon_h << ")";
    } else if (cfg.horizon_h > maxHorizonHours()) {
        err << "horizon_h " << cfg.horizon_h << " exceeds the " << maxHorizonHours() << " h slot-count limit";
    } else if (cfg.min_shift_h < 0 || cfg.max_shift_h < cfg.min_shift_h) {
        err << "shift range [" << cfg.min_shift_h << ", " << cfg.max_shift_h << "] is invalid";
    } else if (cfg.start_time_h >= 0.0 && !std::isfinite(cfg.start_time_h)) {
        err << "start_time_h must be finite";
    }
    const std::string msg = err.str();
    if (!msg.empty()) {
        throw std::invalid_argument(msg);
    }
    validateCongestionParams(cfg.model, cfg.alpha);
}

Simulation::Simulation(const data::RevenueTable& table)
    : table_(table),
      allocator_(std::make_unique<GreedyAssignmentPolicy>()),
      baseline_(std::make_unique<RandomAssignmentPolicy>()) {}

void Simulation::reset(const ScenarioConfig& cfg, std::mt19937_64 rng) {
    const int num_zones = cfg.num_zones > 0 ? cfg.num_zones : table_.zoneCount();
    validateScenario(cfg, num_zones);

    cfg_ = cfg;
    rng_ = std::move(rng);
    num_zones_ = num_zones;
    slot_ = 0;
    total_slots_ = slotCountForHorizon(cfg_.horizon_h);
    trace_.clear();
    if (cfg_.record_trace) {
        trace_.reserve(static_cast<std::size_t>(total_slots_));
    }

    // Start context
    if (cfg_.start_day < 0) {
        std::uniform_int_distribution<int> day_dist(0, kDaysPerWeek - 1);
        ctx_.day = day_dist(rng_);
    } else {
        ctx_.day = cfg_.start_day % kDaysPerWeek;
    }
    if (cfg_.start_time_h < 0.0) {
        std::uniform_real_distribution<double> time_dist(0.0, kHoursPerDay);
        ctx_.time_h = time_dist(rng_);
    } else {
        ctx_.time_h = std::fmod(cfg_.start_time_h, kHoursPerDay);
    }
    ctx_.weather = data::normalizeWeather(cfg_.weather.empty() ? std::string("clear") : cfg_.weather);

    // One population, copied into both strategies.
    std::uniform_int_distribution<int> zone_dist(0, num_zones_ - 1);
    std::uniform_int_distribution<int> shift_dist(cfg_.min_shift_h, cfg_.max_shift_h);
    initial_drivers_.clear();
    initial_drivers_.reserve(static_cast<std::size_t>(cfg_.num_drivers));
    for (int i = 0; i < cfg_.num_drivers; ++i) {
        Driver d;
        d.cluster = zone_dist(rng_);
        d.hours_left = static_cast<double>(shift_dist(rng_));
        initial_drivers_.push_back(d);
    }

    allocator_.reset(initial_drivers_);
    baseline_.reset(initial_drivers_);
}

void Simulation::step() {
    if (isConcluded()) {
        return;
    }

    const std::vector<double> revenues = table_.lookup(ctx_, num_zones_);

    StrategySlotRecord alloc_rec = allocator_.step(revenues, cfg_.model, cfg_.alpha, rng_);
    StrategySlotRecord base_rec = baseline_.step(revenues, cfg_.model, cfg_.alpha, rng_);

    if (cfg_.record_trace) {
        SlotRecord rec;
        rec.slot = slot_;
        rec.context = ctx_;
        rec.revenues = revenues;
        rec.allocator = std::move(alloc_rec);
        rec.baseline = std::move(base_rec);
        trace_.push_back(std::move(rec));
    }

    advanceClock();
    ++slot_;
}

void Simulation::advanceClock() {
    const double t_next = ctx_.time_h + kSlotDuration_h;
    if (t_next >= kHoursPerDay) {
        ctx_.time_h = std::fmod(t_next, kHoursPerDay);
        ctx_.day = (ctx_.day + 1) % kDaysPerWeek;
    } else {
        ctx_.time_h = t_next;
    }
}

TrialOutcome Simulation::runToCompletion() {
    while (!isConcluded()) {
        step();
    }
    return outcome();
}

TrialOutcome Simulation::outcome() const {
    TrialOutcome o;
    o.allocator_total = allocator_.totalRevenue();
    o.baseline_total = baseline_.totalRevenue();
    return o;
}

Observation Simulation::observe() const {
    Observation o;
    o.slot = slot_;
    o.total_slots = total_slots_;
    o.context = ctx_;
    o.allocator_total = allocator_.totalRevenue();
    o.baseline_total = baseline_.totalRevenue();
    o.allocator_active = allocator_.activeCount();
    o.baseline_active = baseline_.activeCount();
    o.num_drivers = static_cast<int>(initial_drivers_.size());
    o.concluded = isConcluded();
    return o;
}

} // namespace taxisim

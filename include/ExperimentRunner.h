#pragma once

#include <cstdint>
#include <functional>
#include <vector>

#include "Simulation.h"

namespace taxisim {

class ExperimentRunner {
public:
    struct ExperimentConfig {
        int num_trials = 1000;
        std::uint64_t seed = 12345u;
        // Trials are split across this many threads; results do not depend on it.
        int workers = 1;
    };

    struct StrategyStats {
        double mean = 0.0;
        double std_dev = 0.0;      // sample (n - 1) standard deviation
        double median = 0.0;
        double ci_lower_95 = 0.0;  // 2.5th percentile of trial totals
        double ci_upper_95 = 0.0;  // 97.5th percentile
    };

    struct DiffStats {
        double mean = 0.0;
        double std_dev = 0.0;
        double min = 0.0;
        double max = 0.0;
    };

    struct Summary {
        int num_trials = 0;
        StrategyStats allocator{};
        StrategyStats baseline{};
        DiffStats diff{};
        // Fraction of trials with allocator_total > baseline_total.
        double win_rate = 0.0;
        // (allocator mean / baseline mean - 1) * 100; 0 if the baseline mean is 0.
        double uplift_pct = 0.0;
        // FNV-1a32 over the effective scenario and seed.
        std::uint32_t run_param_hash_u32 = 0;
    };

    struct Result {
        std::vector<TrialOutcome> trials;
        Summary summary{};
    };

    // The table must outlive the runner; trials only read it.
    explicit ExperimentRunner(const data::RevenueTable& table);

    void setScenario(const ScenarioConfig& scenario);
    const ScenarioConfig& scenario() const { return scenario_; }

    void setExperiment(const ExperimentConfig& experiment);
    const ExperimentConfig& experiment() const { return experiment_; }

    // num_trials < 1 runs a single trial. Throws std::invalid_argument for an
    // unusable scenario before any trial starts, and std::system_error if the
    // worker threads cannot be started.
    Result runExperiment(const ScenarioConfig& scenario, const ExperimentConfig& experiment) const;
    Result runExperiment() const;

    // One trial on its derived stream; fills `trace` when non-null.
    TrialOutcome runTrial(const ScenarioConfig& scenario,
                          std::uint64_t seed,
                          int trial_index,
                          std::vector<SlotRecord>* trace = nullptr) const;

    static Summary summarize(const std::vector<TrialOutcome>& trials);
    static StrategyStats summarizeValues(const std::vector<double>& values);

private:
    const data::RevenueTable& table_;
    ScenarioConfig scenario_{};
    ExperimentConfig experiment_{};
};

std::uint32_t runParamHash(const ScenarioConfig& scenario, std::uint64_t seed);

// Calls fn(i) for every i in [0, count), index i on worker i % workers.
// workers <= 1 runs inline. Every thread that started is joined before
// returning; after that the first failure is rethrown (a thread that could
// not be spawned, else the lowest-numbered worker's exception). Remaining
// indices are skipped once any worker has failed.
void runIndexedParallel(int count, int workers, const std::function<void(int)>& fn);

} // namespace taxisim

#include "ExperimentRunner.h"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstring>
#include <exception>
#include <numeric>
#include <system_error>
#include <thread>

namespace taxisim {

namespace {

int clampTrials(int trials) {
    return trials < 1 ? 1 : trials;
}

inline std::uint32_t fnv1a32_begin() { return 2166136261u; }

inline std::uint32_t fnv1a32_update(std::uint32_t h, const void* data, std::size_t len) {
    const std::uint8_t* p = reinterpret_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<std::uint32_t>(p[i]);
        h *= 16777619u;
    }
    return h;
}

inline std::uint32_t fnv1a32_add_i32(std::uint32_t h, std::int32_t v) {
    return fnv1a32_update(h, &v, sizeof(v));
}

inline std::uint32_t fnv1a32_add_u64(std::uint32_t h, std::uint64_t v) {
    return fnv1a32_update(h, &v, sizeof(v));
}

inline std::uint32_t fnv1a32_add_f64(std::uint32_t h, double v) {
    std::uint64_t bits = 0;
    static_assert(sizeof(bits) == sizeof(v), "unexpected double size");
    std::memcpy(&bits, &v, sizeof(v));
    return fnv1a32_update(h, &bits, sizeof(bits));
}

double sampleStdDev(const std::vector<double>& values, double mean) {
    if (values.size() < 2) {
        return 0.0;
    }
    double ss = 0.0;
    for (double v : values) {
        const double d = v - mean;
        ss += d * d;
    }
    return std::sqrt(ss / static_cast<double>(values.size() - 1));
}

} // namespace

std::uint32_t runParamHash(const ScenarioConfig& scenario, std::uint64_t seed) {
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_i32(h, scenario.num_zones);
    h = fnv1a32_add_i32(h, scenario.num_drivers);
    h = fnv1a32_add_f64(h, scenario.horizon_h);
    h = fnv1a32_add_i32(h, static_cast<std::int32_t>(scenario.model));
    h = fnv1a32_add_f64(h, scenario.alpha);
    h = fnv1a32_add_i32(h, scenario.start_day);
    h = fnv1a32_add_f64(h, scenario.start_time_h);
    h = fnv1a32_update(h, scenario.weather.data(), scenario.weather.size());
    h = fnv1a32_add_i32(h, scenario.min_shift_h);
    h = fnv1a32_add_i32(h, scenario.max_shift_h);
    h = fnv1a32_add_u64(h, seed);
    return h;
}

void runIndexedParallel(int count, int workers, const std::function<void(int)>& fn) {
    if (count <= 0) {
        return;
    }
    const int n_workers = std::max(1, std::min(workers, count));
    if (n_workers == 1) {
        for (int i = 0; i < count; ++i) {
            fn(i);
        }
        return;
    }

    std::atomic<bool> abort{false};
    std::vector<std::exception_ptr> errors(static_cast<std::size_t>(n_workers));

    auto run_range = [&](int first) {
        try {
            for (int i = first; i < count && !abort.load(); i += n_workers) {
                fn(i);
            }
        } catch (...) {
            // Rethrown on the calling thread after every worker has joined.
            errors[static_cast<std::size_t>(first)] = std::current_exception();
            abort.store(true);
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(static_cast<std::size_t>(n_workers));
    std::exception_ptr spawn_error;
    try {
        for (int w = 0; w < n_workers; ++w) {
            pool.emplace_back(run_range, w);
        }
    } catch (const std::system_error&) {
        spawn_error = std::current_exception();
        abort.store(true);
    }

    for (auto& th : pool) {
        th.join();
    }

    if (spawn_error) {
        std::rethrow_exception(spawn_error);
    }
    for (const auto& e : errors) {
        if (e) {
            std::rethrow_exception(e);
        }
    }
}

ExperimentRunner::ExperimentRunner(const data::RevenueTable& table) : table_(table) {}

void ExperimentRunner::setScenario(const ScenarioConfig& scenario) {
    scenario_ = scenario;
}

void ExperimentRunner::setExperiment(const ExperimentConfig& experiment) {
    experiment_ = experiment;
}

TrialOutcome ExperimentRunner::runTrial(const ScenarioConfig& scenario,
                                        std::uint64_t seed,
                                        int trial_index,
                                        std::vector<SlotRecord>* trace) const {
    ScenarioConfig cfg = scenario;
    cfg.record_trace = (trace != nullptr);

    Simulation sim(table_);
    sim.reset(cfg, makeTrialRng(seed, static_cast<std::uint64_t>(trial_index)));
    const TrialOutcome outcome = sim.runToCompletion();
    if (trace) {
        *trace = sim.trace();
    }
    return outcome;
}

ExperimentRunner::StrategyStats ExperimentRunner::summarizeValues(const std::vector<double>& values) {
    StrategyStats result{};
    if (values.empty()) {
        return result;
    }

    const double mean = std::accumulate(values.begin(), values.end(), 0.0) / values.size();

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    auto percentile = [&](double p) {
        if (sorted.size() == 1) return sorted.front();
        const double pos = p * (sorted.size() - 1);
        const std::size_t idx = static_cast<std::size_t>(pos);
        const double frac = pos - static_cast<double>(idx);
        if (idx + 1 >= sorted.size()) return sorted.back();
        return sorted[idx] * (1.0 - frac) + sorted[idx + 1] * frac;
    };

    result.mean = mean;
    result.std_dev = sampleStdDev(values, mean);
    result.median = percentile(0.5);
    result.ci_lower_95 = percentile(0.025);
    result.ci_upper_95 = percentile(0.975);
    return result;
}

ExperimentRunner::Summary ExperimentRunner::summarize(const std::vector<TrialOutcome>& trials) {
    Summary summary{};
    summary.num_trials = static_cast<int>(trials.size());
    if (trials.empty()) {
        return summary;
    }

    std::vector<double> alloc;
    std::vector<double> base;
    std::vector<double> diff;
    alloc.reserve(trials.size());
    base.reserve(trials.size());
    diff.reserve(trials.size());

    int wins = 0;
    for (const auto& t : trials) {
        alloc.push_back(t.allocator_total);
        base.push_back(t.baseline_total);
        diff.push_back(t.diff());
        if (t.allocator_total > t.baseline_total) {
            ++wins;
        }
    }

    summary.allocator = summarizeValues(alloc);
    summary.baseline = summarizeValues(base);

    summary.diff.mean = std::accumulate(diff.begin(), diff.end(), 0.0) / diff.size();
    summary.diff.std_dev = sampleStdDev(diff, summary.diff.mean);
    summary.diff.min = *std::min_element(diff.begin(), diff.end());
    summary.diff.max = *std::max_element(diff.begin(), diff.end());

    summary.win_rate = static_cast<double>(wins) / static_cast<double>(trials.size());
    summary.uplift_pct = (summary.baseline.mean != 0.0)
        ? (summary.allocator.mean / summary.baseline.mean - 1.0) * 100.0
        : 0.0;
    return summary;
}

ExperimentRunner::Result ExperimentRunner::runExperiment(const ScenarioConfig& scenario,
                                                         const ExperimentConfig& experiment) const {
    const int trials = clampTrials(experiment.num_trials);
    const int num_zones = scenario.num_zones > 0 ? scenario.num_zones : table_.zoneCount();
    validateScenario(scenario, num_zones);

    ScenarioConfig cfg = scenario;
    cfg.record_trace = false;

    Result result;
    result.trials.resize(static_cast<std::size_t>(trials));

    // Trial i always runs on makeTrialRng(seed, i); outcomes land at index i.
    runIndexedParallel(trials, experiment.workers, [&](int i) {
        result.trials[static_cast<std::size_t>(i)] = runTrial(cfg, experiment.seed, i);
    });

    result.summary = summarize(result.trials);
    result.summary.run_param_hash_u32 = runParamHash(cfg, experiment.seed);
    return result;
}

ExperimentRunner::Result ExperimentRunner::runExperiment() const {
    return runExperiment(scenario_, experiment_);
}

} // namespace taxisim

#include "ExperimentRunner.h"
#include "GreedyAllocator.h"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace {
struct CheckResult {
    std::string name;
    std::string expected;
    std::string observed;
    bool pass = false;
};

static std::string yesno(bool v) { return v ? "YES" : "NO"; }

static std::string formatCounts(const std::vector<int>& v) {
    std::string s = "[";
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (i) s += ",";
        s += std::to_string(v[i]);
    }
    return s + "]";
}

static std::string formatDouble(double v, int precision) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(precision) << v;
    return os.str();
}

// Scenario A: two zones [10, 4], saturation alpha 0.6, three drivers.
static CheckResult runTwoZoneAllocation() {
    const std::vector<int> expected = {2, 1};
    const auto counts = taxisim::allocateGreedy(3, {10.0, 4.0}, taxisim::CongestionModel::Saturation, 0.6);
    return {"Two-zone greedy allocation", formatCounts(expected), formatCounts(counts), counts == expected};
}

// Scenario B: every revenue is zero, so every gain ties and zone 0 wins.
static CheckResult runAllZeroRevenues() {
    const std::vector<int> expected = {4, 0, 0};
    const auto counts = taxisim::allocateGreedy(4, {0.0, 0.0, 0.0}, taxisim::CongestionModel::Saturation, 0.6);
    return {"All-zero revenues tie-break", formatCounts(expected), formatCounts(counts), counts == expected};
}

// Scenario C: a stayer with half an hour left earns exactly one slot.
static CheckResult runLastSlotStayer() {
    const std::vector<double> revenues = {10.0};
    const double alpha = 0.6;
    const double expected = 10.0 * (1.0 - std::exp(-alpha));

    taxisim::StrategyState state(std::make_unique<taxisim::GreedyAssignmentPolicy>());
    taxisim::Driver d;
    d.cluster = 0;
    d.hours_left = 0.5;
    state.reset({d});

    std::mt19937_64 rng(1);
    for (int i = 0; i < 4; ++i) {
        state.step(revenues, taxisim::CongestionModel::Saturation, alpha, rng);
    }
    const double observed = state.totalRevenue();
    const bool pass = std::fabs(observed - expected) < 1e-9 && state.drivers().front().hours_left == 0.0;
    return {"Last-slot stayer revenue", formatDouble(expected, 6), formatDouble(observed, 6), pass};
}

// Scenario D: one dominant zone; the allocator should beat random relocation.
static CheckResult runDominantZoneExperiment() {
    std::vector<taxisim::data::RevenueRow> rows;
    for (int z = 0; z < 5; ++z) {
        taxisim::data::RevenueRow r;
        r.zone_id = z;
        r.expected_revenue = (z == 0) ? 100.0 : 1.0;
        rows.push_back(r);
    }
    const taxisim::data::RevenueTable table(rows);

    taxisim::ScenarioConfig scenario;
    scenario.num_drivers = 30;
    scenario.horizon_h = 6.0;

    taxisim::ExperimentRunner::ExperimentConfig experiment;
    experiment.num_trials = 200;
    experiment.seed = 12345u;

    taxisim::ExperimentRunner runner(table);
    const auto result = runner.runExperiment(scenario, experiment);
    const double win_rate = result.summary.win_rate;
    return {"Dominant-zone win rate", "> 0.500", formatDouble(win_rate, 3), win_rate > 0.5};
}
} // namespace

int main() {
    std::cout << "=== TAXISIM VALIDATION SUITE ===\n";
    std::cout << "Greedy congestion-aware allocation vs. random relocation\n\n";

    std::vector<CheckResult> results;
    results.push_back(runTwoZoneAllocation());
    results.push_back(runAllZeroRevenues());
    results.push_back(runLastSlotStayer());
    results.push_back(runDominantZoneExperiment());

    for (const auto& r : results) {
        std::cout << "=== " << r.name << " ===\n";
        std::cout << "Expected: " << r.expected << "\n";
        std::cout << "Observed: " << r.observed << "\n";
        std::cout << "Matches: " << yesno(r.pass) << "\n\n";
    }

    int pass = 0;
    std::cout << "Scenario                        | Matches | Status\n";
    std::cout << "--------------------------------------------------\n";
    for (const auto& r : results) {
        if (r.pass) ++pass;
        std::cout << std::left << std::setw(32) << r.name << " | "
                  << std::setw(7) << yesno(r.pass) << " | "
                  << (r.pass ? "PASS" : "FAIL") << "\n";
    }
    std::cout << "\nTOTAL: " << pass << "/" << results.size() << " scenarios matched\n\n";

    const std::string csv_name = "validation_results.csv";
    std::ofstream csv(csv_name);
    if (csv) {
        csv << "Scenario,Expected,Observed,Matches\n";
        for (const auto& r : results) {
            csv << r.name << ",\"" << r.expected << "\",\"" << r.observed << "\"," << yesno(r.pass) << "\n";
        }
        csv.close();
        std::cout << "Results exported to: " << csv_name << "\n";
    }

    return pass == static_cast<int>(results.size()) ? 0 : 1;
}

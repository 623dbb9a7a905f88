#include "ExperimentRunner.h"
#include "ResultExport.h"
#include "../data/revenue_csv.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <exception>
#include <iostream>
#include <string>

namespace {
std::string toLower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

void printUsage() {
    std::cout << "ExperimentTool usage:\n"
              << "  ExperimentTool [--data revenue.csv | --zones k] [--drivers n] [--hours h]\n"
              << "                 [--trials n] [--model saturation|split] [--alpha a] [--seed s]\n"
              << "                 [--day d] [--time t] [--weather w] [--workers n]\n"
              << "                 [--out trials.csv] [--summary summary.csv] [--trace trace.csv]\n";
}

void printStats(const char* name, const taxisim::ExperimentRunner::StrategyStats& s) {
    std::printf("%-10s %12.2f %12.2f %12.2f %12.2f %12.2f\n",
                name, s.mean, s.std_dev, s.median, s.ci_lower_95, s.ci_upper_95);
}

int run(int argc, char** argv) {
    taxisim::ScenarioConfig scenario;
    taxisim::ExperimentRunner::ExperimentConfig experiment;
    experiment.num_trials = 500;

    int zones = 6;
    std::string data_path;
    std::string trials_out;
    std::string summary_out;
    std::string trace_out;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--data" && i + 1 < argc) {
            data_path = argv[++i];
        } else if (arg == "--zones" && i + 1 < argc) {
            zones = std::stoi(argv[++i]);
        } else if (arg == "--drivers" && i + 1 < argc) {
            scenario.num_drivers = std::stoi(argv[++i]);
        } else if (arg == "--hours" && i + 1 < argc) {
            scenario.horizon_h = std::stod(argv[++i]);
        } else if (arg == "--trials" && i + 1 < argc) {
            experiment.num_trials = std::stoi(argv[++i]);
        } else if (arg == "--model" && i + 1 < argc) {
            scenario.model = taxisim::parseCongestionModel(argv[++i]);
        } else if (arg == "--alpha" && i + 1 < argc) {
            scenario.alpha = std::stod(argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            experiment.seed = std::stoull(argv[++i]);
        } else if (arg == "--day" && i + 1 < argc) {
            scenario.start_day = std::stoi(argv[++i]);
        } else if (arg == "--time" && i + 1 < argc) {
            scenario.start_time_h = std::stod(argv[++i]);
        } else if (arg == "--weather" && i + 1 < argc) {
            scenario.weather = toLower(argv[++i]);
        } else if (arg == "--workers" && i + 1 < argc) {
            experiment.workers = std::stoi(argv[++i]);
        } else if (arg == "--out" && i + 1 < argc) {
            trials_out = argv[++i];
        } else if (arg == "--summary" && i + 1 < argc) {
            summary_out = argv[++i];
        } else if (arg == "--trace" && i + 1 < argc) {
            trace_out = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            std::cout << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    const taxisim::data::RevenueTable table = data_path.empty()
        ? taxisim::data::makeSyntheticRevenueTable(zones, experiment.seed)
        : taxisim::data::loadRevenueCSV(data_path);

    std::cout << "Revenue table: " << table.size() << " rows, " << table.zoneCount() << " zones"
              << (data_path.empty() ? " (synthetic)" : "") << "\n";
    std::cout << "Running " << experiment.num_trials << " trials: "
              << scenario.num_drivers << " drivers, " << scenario.horizon_h << " h, model "
              << taxisim::congestionModelName(scenario.model) << ", alpha " << scenario.alpha << "\n";

    taxisim::ExperimentRunner runner(table);
    runner.setScenario(scenario);
    runner.setExperiment(experiment);
    const auto result = runner.runExperiment();
    const auto& s = result.summary;

    std::printf("\n%-10s %12s %12s %12s %12s %12s\n",
                "strategy", "mean", "std", "median", "ci_lo_95", "ci_hi_95");
    printStats("allocator", s.allocator);
    printStats("baseline", s.baseline);
    std::printf("\ndiff: mean %.2f  std %.2f  min %.2f  max %.2f\n",
                s.diff.mean, s.diff.std_dev, s.diff.min, s.diff.max);
    std::printf("allocator win rate: %.1f%%\n", s.win_rate * 100.0);
    std::printf("uplift vs baseline: %+.2f%%\n", s.uplift_pct);
    std::printf("run hash: %08x\n", s.run_param_hash_u32);

    int status = 0;
    if (!trials_out.empty()) {
        if (taxisim::exportTrialsCSV(trials_out, result.trials)) {
            std::cout << "Wrote trials to: " << trials_out << "\n";
        } else {
            std::cerr << "Failed to write trials to: " << trials_out << "\n";
            status = 1;
        }
    }
    if (!summary_out.empty()) {
        if (taxisim::exportSummaryCSV(summary_out, s)) {
            std::cout << "Wrote summary to: " << summary_out << "\n";
        } else {
            std::cerr << "Failed to write summary to: " << summary_out << "\n";
            status = 1;
        }
    }
    if (!trace_out.empty()) {
        // Trace of trial 0, same stream as in the experiment.
        std::vector<taxisim::SlotRecord> trace;
        runner.runTrial(scenario, experiment.seed, 0, &trace);
        if (taxisim::exportTraceCSV(trace_out, trace)) {
            std::cout << "Wrote trace of trial 0 to: " << trace_out << "\n";
        } else {
            std::cerr << "Failed to write trace to: " << trace_out << "\n";
            status = 1;
        }
    }
    return status;
}
} // namespace

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "FATAL: %s\n", e.what());
        return 1;
    }
}

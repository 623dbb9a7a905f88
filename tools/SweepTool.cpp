#include "SensitivityAnalysis.h"
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
    std::cout << "SweepTool usage:\n"
              << "  SweepTool --param <alpha|drivers|hours> [--min v] [--max v] [--samples n]\n"
              << "            [--trials n] [--data revenue.csv] [--zones k] [--seed s] [--out file]\n";
}

int run(int argc, char** argv) {
    std::string param;
    double min_val = 0.0;
    double max_val = 0.0;
    int samples = 5;
    int trials = 200;
    int zones = 6;
    unsigned long long seed = 12345ull;
    std::string data_path;
    std::string out = "sensitivity.csv";
    bool min_set = false;
    bool max_set = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--param" && i + 1 < argc) {
            param = toLower(argv[++i]);
        } else if (arg == "--min" && i + 1 < argc) {
            min_val = std::stod(argv[++i]);
            min_set = true;
        } else if (arg == "--max" && i + 1 < argc) {
            max_val = std::stod(argv[++i]);
            max_set = true;
        } else if (arg == "--samples" && i + 1 < argc) {
            samples = std::stoi(argv[++i]);
        } else if (arg == "--trials" && i + 1 < argc) {
            trials = std::stoi(argv[++i]);
        } else if (arg == "--zones" && i + 1 < argc) {
            zones = std::stoi(argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            seed = std::stoull(argv[++i]);
        } else if (arg == "--data" && i + 1 < argc) {
            data_path = argv[++i];
        } else if (arg == "--out" && i + 1 < argc) {
            out = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            std::cout << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    if (param.empty()) {
        printUsage();
        return 1;
    }

    const taxisim::data::RevenueTable table = data_path.empty()
        ? taxisim::data::makeSyntheticRevenueTable(zones, seed)
        : taxisim::data::loadRevenueCSV(data_path);

    taxisim::SensitivityAnalyzer analyzer(table);
    taxisim::ScenarioConfig scenario;
    analyzer.setScenario(scenario);

    taxisim::ExperimentRunner::ExperimentConfig experiment;
    experiment.num_trials = trials;
    experiment.seed = seed;
    analyzer.setExperiment(experiment);

    taxisim::SensitivityAnalyzer::ParameterRange range;
    range.samples = samples;

    if (param == "alpha") {
        range.nominal = scenario.alpha;
    } else if (param == "drivers" || param == "num_drivers") {
        range.nominal = static_cast<double>(scenario.num_drivers);
    } else if (param == "hours" || param == "horizon" || param == "horizon_h") {
        range.nominal = scenario.horizon_h;
    } else {
        std::cout << "Unsupported parameter: " << param << "\n";
        printUsage();
        return 1;
    }

    if (!min_set) {
        min_val = range.nominal * 0.75;
    }
    if (!max_set) {
        max_val = range.nominal * 1.25;
    }

    range.min = min_val;
    range.max = max_val;

    if (param == "alpha") {
        analyzer.analyzeAlpha(range);
    } else if (param == "drivers" || param == "num_drivers") {
        analyzer.analyzeDriverCount(range);
    } else {
        analyzer.analyzeHorizon(range);
    }

    for (const auto& row : analyzer.results()) {
        std::printf("%-8s %10.4f  alloc=%10.2f  base=%10.2f  win=%.3f  uplift=%+.2f%%\n",
                    row.parameter_name.c_str(), row.parameter_value,
                    row.metrics.allocator_mean, row.metrics.baseline_mean,
                    row.metrics.win_rate, row.metrics.uplift_pct);
    }

    if (!analyzer.exportSensitivityMatrixCSV(out)) {
        std::cerr << "Failed to write sensitivity sweep to: " << out << "\n";
        return 1;
    }
    std::cout << "Wrote sensitivity sweep to: " << out << "\n";
    return 0;
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

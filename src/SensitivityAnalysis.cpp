#include "SensitivityAnalysis.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>

namespace taxisim {

SensitivityAnalyzer::SensitivityAnalyzer(const data::RevenueTable& table) : runner_(table) {}

void SensitivityAnalyzer::setScenario(const ScenarioConfig& scenario) {
    scenario_ = scenario;
}

void SensitivityAnalyzer::setExperiment(const ExperimentRunner::ExperimentConfig& experiment) {
    experiment_ = experiment;
}

void SensitivityAnalyzer::clearResults() {
    results_.clear();
}

std::vector<double> SensitivityAnalyzer::sampleValues(const ParameterRange& range) const {
    std::vector<double> values;
    if (range.samples <= 1 || range.max <= range.min) {
        values.push_back(range.nominal);
        return values;
    }

    values.reserve(static_cast<std::size_t>(range.samples));
    const double span = range.max - range.min;
    const int steps = range.samples - 1;
    for (int i = 0; i < range.samples; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(steps);
        values.push_back(range.min + span * t);
    }
    return values;
}

SensitivityAnalyzer::SampleResult SensitivityAnalyzer::runScenario(const ScenarioConfig& scenario) const {
    const auto result = runner_.runExperiment(scenario, experiment_);

    SampleResult m{};
    m.allocator_mean = result.summary.allocator.mean;
    m.baseline_mean = result.summary.baseline.mean;
    m.win_rate = result.summary.win_rate;
    m.uplift_pct = result.summary.uplift_pct;
    return m;
}

void SensitivityAnalyzer::analyzeAlpha(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        ScenarioConfig scenario = scenario_;
        scenario.alpha = value;
        const auto metrics = runScenario(scenario);
        results_.push_back({"alpha", value, metrics});
    }
}

void SensitivityAnalyzer::analyzeDriverCount(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        ScenarioConfig scenario = scenario_;
        const double clamped = std::min(std::max(value, 0.0), static_cast<double>(std::numeric_limits<int>::max()));
        scenario.num_drivers = static_cast<int>(std::lround(clamped));
        const auto metrics = runScenario(scenario);
        results_.push_back({"drivers", static_cast<double>(scenario.num_drivers), metrics});
    }
}

void SensitivityAnalyzer::analyzeHorizon(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        ScenarioConfig scenario = scenario_;
        scenario.horizon_h = std::max(kSlotDuration_h, std::round(value / kSlotDuration_h) * kSlotDuration_h);
        const auto metrics = runScenario(scenario);
        results_.push_back({"hours", scenario.horizon_h, metrics});
    }
}

bool SensitivityAnalyzer::exportSensitivityMatrixCSV(const std::string& filename) const {
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }

    out << "parameter,value,allocator_mean,baseline_mean,win_rate,uplift_pct\n";
    out << std::fixed << std::setprecision(6);
    for (const auto& row : results_) {
        out << row.parameter_name << ','
            << row.parameter_value << ','
            << row.metrics.allocator_mean << ','
            << row.metrics.baseline_mean << ','
            << row.metrics.win_rate << ','
            << row.metrics.uplift_pct << '\n';
    }
    return true;
}

const std::vector<SensitivityAnalyzer::SensitivityRow>& SensitivityAnalyzer::results() const {
    return results_;
}

} // namespace taxisim

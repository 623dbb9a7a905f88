#pragma once

#include <string>
#include <vector>

#include "ExperimentRunner.h"

namespace taxisim {

class SensitivityAnalyzer {
public:
    struct ParameterRange {
        double nominal = 0.0;
        double min = 0.0;
        double max = 0.0;
        int samples = 0;
    };

    struct SampleResult {
        double allocator_mean = 0.0;
        double baseline_mean = 0.0;
        double win_rate = 0.0;
        double uplift_pct = 0.0;
    };

    struct SensitivityRow {
        std::string parameter_name;
        double parameter_value = 0.0;
        SampleResult metrics{};
    };

    // The table must outlive the analyzer.
    explicit SensitivityAnalyzer(const data::RevenueTable& table);

    void setScenario(const ScenarioConfig& scenario);
    void setExperiment(const ExperimentRunner::ExperimentConfig& experiment);
    void clearResults();

    void analyzeAlpha(const ParameterRange& range);
    // Values are rounded to the nearest whole driver / half-hour slot.
    void analyzeDriverCount(const ParameterRange& range);
    void analyzeHorizon(const ParameterRange& range);

    bool exportSensitivityMatrixCSV(const std::string& filename) const;
    const std::vector<SensitivityRow>& results() const;

private:
    ExperimentRunner runner_;
    ScenarioConfig scenario_{};
    ExperimentRunner::ExperimentConfig experiment_{};
    std::vector<SensitivityRow> results_{};

    SampleResult runScenario(const ScenarioConfig& scenario) const;
    std::vector<double> sampleValues(const ParameterRange& range) const;
};

} // namespace taxisim

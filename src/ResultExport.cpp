#include "ResultExport.h"

#include <fstream>
#include <iomanip>

namespace taxisim {

namespace {

void writeStatsRow(std::ostream& out, const char* name, const ExperimentRunner::StrategyStats& s) {
    out << name << ','
        << s.mean << ','
        << s.std_dev << ','
        << s.median << ','
        << s.ci_lower_95 << ','
        << s.ci_upper_95 << '\n';
}

void writeStrategyRows(std::ostream& out,
                       const SlotRecord& rec,
                       const char* name,
                       const StrategySlotRecord& s) {
    for (std::size_t i = 0; i < s.zones_before.size(); ++i) {
        const int after = i < s.zones_after.size() ? s.zones_after[i] : s.zones_before[i];
        out << rec.slot << ','
            << name << ','
            << rec.context.day << ','
            << rec.context.time_h << ','
            << i << ','
            << s.zones_before[i] << ','
            << after << ','
            << s.slot_revenue << '\n';
    }
}

} // namespace

bool exportTrialsCSV(const std::string& filename, const std::vector<TrialOutcome>& trials) {
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }

    out << "trial,allocator_total,baseline_total,diff\n";
    out << std::fixed << std::setprecision(6);
    for (std::size_t i = 0; i < trials.size(); ++i) {
        out << i << ','
            << trials[i].allocator_total << ','
            << trials[i].baseline_total << ','
            << trials[i].diff() << '\n';
    }
    return true;
}

bool exportSummaryCSV(const std::string& filename, const ExperimentRunner::Summary& summary) {
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }

    out << "strategy,mean,std,median,ci_lower_95,ci_upper_95\n";
    out << std::fixed << std::setprecision(6);
    writeStatsRow(out, "allocator", summary.allocator);
    writeStatsRow(out, "baseline", summary.baseline);
    out << "win_rate," << summary.win_rate << '\n';
    out << "uplift_pct," << summary.uplift_pct << '\n';
    out << "num_trials," << summary.num_trials << '\n';
    out << "run_param_hash," << summary.run_param_hash_u32 << '\n';
    return true;
}

bool exportTraceCSV(const std::string& filename, const std::vector<SlotRecord>& trace) {
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }

    out << "slot,strategy,day,time,driver,zone_before,zone_after,slot_revenue\n";
    out << std::fixed << std::setprecision(6);
    for (const auto& rec : trace) {
        writeStrategyRows(out, rec, "allocator", rec.allocator);
        writeStrategyRows(out, rec, "baseline", rec.baseline);
    }
    return true;
}

} // namespace taxisim

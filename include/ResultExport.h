#pragma once

#include <string>
#include <vector>

#include "ExperimentRunner.h"

namespace taxisim {

// All writers use fixed 6-digit precision and return false when the file
// cannot be opened.

// trial,allocator_total,baseline_total,diff
bool exportTrialsCSV(const std::string& filename, const std::vector<TrialOutcome>& trials);

// strategy,mean,std,median,ci_lower_95,ci_upper_95 (allocator, baseline),
// then win_rate, uplift_pct and run_param_hash lines.
bool exportSummaryCSV(const std::string& filename, const ExperimentRunner::Summary& summary);

// slot,strategy,day,time,driver,zone_before,zone_after,slot_revenue
// One row per driver per slot per strategy.
bool exportTraceCSV(const std::string& filename, const std::vector<SlotRecord>& trace);

} // namespace taxisim

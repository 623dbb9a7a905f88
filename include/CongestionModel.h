#pragma once

#include <string>
#include <vector>

namespace taxisim {

// ============================================================
// Per-zone congestion models
//
// realized(n, R) maps the number of drivers working a zone and the zone's
// expected base revenue to the revenue actually captured there:
//   Saturation: R * (1 - exp(-alpha * n)) for n > 0, else 0
//   Split:      R for n > 0, else 0 (coverage indicator)
// ============================================================
enum class CongestionModel : int {
    Saturation = 0,
    Split      = 1,
};

// Accepts "saturation" / "split" (trimmed, case-insensitive).
// Throws std::invalid_argument for any other name.
CongestionModel parseCongestionModel(const std::string& name);
const char* congestionModelName(CongestionModel model);

// Throws std::invalid_argument if alpha is unusable for the model
// (Saturation needs a finite alpha > 0; Split ignores alpha).
void validateCongestionParams(CongestionModel model, double alpha);

// Non-finite or non-positive revenue realizes 0.
double realizedRevenue(CongestionModel model, int n, double revenue, double alpha);

// realized(n + 1) - realized(n)
double marginalGain(CongestionModel model, int n, double revenue, double alpha);

// Sum over zones of realized(counts[k], revenues[k]).
// Throws std::invalid_argument on length mismatch, negative counts or bad alpha.
double computeMacro(const std::vector<int>& counts,
                    const std::vector<double>& revenues,
                    CongestionModel model,
                    double alpha);

// Histogram of zone ids (bincount). Throws std::invalid_argument for ids
// outside [0, num_zones).
std::vector<int> zoneCounts(const std::vector<int>& zones, int num_zones);

} // namespace taxisim

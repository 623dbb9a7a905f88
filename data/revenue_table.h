#pragma once

// data/revenue_table.h
//
// In-memory expected-revenue table and the context -> per-zone revenue oracle.
//
// Design goals:
//   - No I/O here; loading lives in revenue_csv.h.
//   - Lookup is a pure function of (rows, context, zone count).
//   - Deterministic tie-breaking: natural row order wins.
//
// Resolution order for lookup(ctx, K):
//   1. rows with ctx.day and ctx.weather
//   2. rows with ctx.day (any weather)
//   3. every row
// Within the subset, each zone takes the row whose time is nearest on the
// 24 h circle. Zones left without a row (or, under TreatZeroAsMissing, with a
// zero revenue) fall back to the zone mean over the whole table, then to the
// mean of the zone means.

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace taxisim {
namespace data {

struct RevenueContext {
    int day = 0;           // 0 = Monday .. 6 = Sunday
    double time_h = 0.0;   // hour of day in [0, 24)
    std::string weather = "clear";
};

struct RevenueRow {
    int day = 0;
    double time_h = 0.0;
    std::string weather = "clear";
    int zone_id = 0;
    double expected_revenue = 0.0;
};

enum class ZeroRevenuePolicy : int {
    // A resolved revenue of exactly 0 is treated like a missing zone.
    TreatZeroAsMissing = 0,
    // Only zones with no selected row take the fallback.
    KeepZero = 1,
};

// Trim + lower-case, the canonical form for weather labels.
std::string normalizeWeather(const std::string& weather);

// min(|a-b|, 24-|a-b|) for hours already wrapped into [0, 24).
double circularHourDistance(double a_h, double b_h);

class RevenueTable {
public:
    RevenueTable() = default;
    explicit RevenueTable(const std::vector<RevenueRow>& rows);

    // Negative or non-finite revenues are stored as 0; time is wrapped into
    // [0, 24); weather is normalized. Rows with a negative zone id are dropped.
    void addRow(const RevenueRow& row);
    void clear();

    const std::vector<RevenueRow>& rows() const { return rows_; }
    bool empty() const { return rows_.empty(); }
    std::size_t size() const { return rows_.size(); }

    // max(zone_id) + 1, or 0 for an empty table.
    int zoneCount() const { return static_cast<int>(zone_sum_.size()); }

    bool hasZone(int zone) const;
    // Mean over every row of the zone; falls back to globalMean() if absent.
    double zoneMean(int zone) const;
    // Mean of the per-zone means (zones that have rows). 0 for an empty table.
    double globalMean() const;

    void setZeroRevenuePolicy(ZeroRevenuePolicy p) { zero_policy_ = p; }
    ZeroRevenuePolicy zeroRevenuePolicy() const { return zero_policy_; }

    // Always returns exactly num_zones non-negative entries.
    std::vector<double> lookup(const RevenueContext& ctx, int num_zones) const;

private:
    std::vector<RevenueRow> rows_;
    std::vector<double> zone_sum_;
    std::vector<int> zone_rows_;

    // Row indices in natural order, keyed by day and by (day, weather).
    std::map<int, std::vector<std::size_t>> by_day_;
    std::map<std::pair<int, std::string>, std::vector<std::size_t>> by_day_weather_;

    ZeroRevenuePolicy zero_policy_ = ZeroRevenuePolicy::TreatZeroAsMissing;
};

// Demo table: base revenue per zone uniform in [8, 25), modulated by hour of
// day and day of week, every day x every hour, weather "clear".
RevenueTable makeSyntheticRevenueTable(int num_zones, std::uint64_t seed = 12345u);

} // namespace data
} // namespace taxisim

// data/revenue_table.cpp
//
// Implementation notes:
//   - Row indices are bucketed once on insertion so a lookup only scans the
//     selected subset.
//   - The nearest-row search uses strict '<', so the first row in natural
//     order wins a distance tie.

#include "revenue_table.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <random>

namespace taxisim {
namespace data {

static constexpr double kHoursPerDay = 24.0;
static constexpr double kPi = 3.14159265358979323846;

static inline double wrapHour(double t_h) {
    if (!std::isfinite(t_h)) return 0.0;
    double w = std::fmod(t_h, kHoursPerDay);
    if (w < 0.0) w += kHoursPerDay;
    // fmod of a tiny negative can round back up to exactly 24.
    if (w >= kHoursPerDay) w = 0.0;
    return w;
}

static inline int wrapDay(int day) {
    const int d = day % 7;
    return d < 0 ? d + 7 : d;
}

std::string normalizeWeather(const std::string& weather) {
    std::size_t b = 0;
    std::size_t e = weather.size();
    while (b < e && std::isspace(static_cast<unsigned char>(weather[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(weather[e - 1]))) --e;
    std::string out = weather.substr(b, e - b);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

double circularHourDistance(double a_h, double b_h) {
    const double d = std::fabs(a_h - b_h);
    return std::min(d, kHoursPerDay - d);
}

RevenueTable::RevenueTable(const std::vector<RevenueRow>& rows) {
    rows_.reserve(rows.size());
    for (const auto& r : rows) {
        addRow(r);
    }
}

void RevenueTable::addRow(const RevenueRow& row) {
    if (row.zone_id < 0) {
        return;
    }

    RevenueRow r = row;
    r.day = wrapDay(row.day);
    r.time_h = wrapHour(row.time_h);
    r.weather = normalizeWeather(row.weather);
    if (!std::isfinite(r.expected_revenue) || r.expected_revenue < 0.0) {
        r.expected_revenue = 0.0;
    }

    const std::size_t idx = rows_.size();
    rows_.push_back(r);

    if (static_cast<std::size_t>(r.zone_id) >= zone_sum_.size()) {
        zone_sum_.resize(static_cast<std::size_t>(r.zone_id) + 1, 0.0);
        zone_rows_.resize(static_cast<std::size_t>(r.zone_id) + 1, 0);
    }
    zone_sum_[r.zone_id] += r.expected_revenue;
    zone_rows_[r.zone_id] += 1;

    by_day_[r.day].push_back(idx);
    by_day_weather_[std::make_pair(r.day, r.weather)].push_back(idx);
}

void RevenueTable::clear() {
    rows_.clear();
    zone_sum_.clear();
    zone_rows_.clear();
    by_day_.clear();
    by_day_weather_.clear();
}

bool RevenueTable::hasZone(int zone) const {
    return zone >= 0 && zone < zoneCount() && zone_rows_[zone] > 0;
}

double RevenueTable::globalMean() const {
    double sum = 0.0;
    int n = 0;
    for (std::size_t k = 0; k < zone_rows_.size(); ++k) {
        if (zone_rows_[k] > 0) {
            sum += zone_sum_[k] / static_cast<double>(zone_rows_[k]);
            ++n;
        }
    }
    return n > 0 ? sum / static_cast<double>(n) : 0.0;
}

double RevenueTable::zoneMean(int zone) const {
    if (!hasZone(zone)) {
        return globalMean();
    }
    return zone_sum_[zone] / static_cast<double>(zone_rows_[zone]);
}

std::vector<double> RevenueTable::lookup(const RevenueContext& ctx, int num_zones) const {
    const std::size_t K = num_zones > 0 ? static_cast<std::size_t>(num_zones) : 0u;
    std::vector<double> rev(K, 0.0);
    if (K == 0 || rows_.empty()) {
        return rev;
    }

    const int day = wrapDay(ctx.day);
    const double t_h = wrapHour(ctx.time_h);
    const std::string weather = normalizeWeather(ctx.weather);

    // 1) exact day + weather, 2) day only, 3) everything.
    const std::vector<std::size_t>* subset = nullptr;
    auto it_dw = by_day_weather_.find(std::make_pair(day, weather));
    if (it_dw != by_day_weather_.end() && !it_dw->second.empty()) {
        subset = &it_dw->second;
    } else {
        auto it_d = by_day_.find(day);
        if (it_d != by_day_.end() && !it_d->second.empty()) {
            subset = &it_d->second;
        }
    }

    std::vector<double> best_dist(K, std::numeric_limits<double>::infinity());
    std::vector<bool> has_row(K, false);

    auto consider = [&](std::size_t row_idx) {
        const RevenueRow& r = rows_[row_idx];
        if (r.zone_id >= num_zones) return;
        const double d = circularHourDistance(r.time_h, t_h);
        if (d < best_dist[r.zone_id]) {
            best_dist[r.zone_id] = d;
            rev[r.zone_id] = r.expected_revenue;
            has_row[r.zone_id] = true;
        }
    };

    if (subset) {
        for (std::size_t idx : *subset) consider(idx);
    } else {
        for (std::size_t idx = 0; idx < rows_.size(); ++idx) consider(idx);
    }

    for (std::size_t k = 0; k < K; ++k) {
        const bool missing = !has_row[k] ||
            (zero_policy_ == ZeroRevenuePolicy::TreatZeroAsMissing && rev[k] == 0.0);
        if (missing) {
            rev[k] = zoneMean(static_cast<int>(k));
        }
    }
    return rev;
}

RevenueTable makeSyntheticRevenueTable(int num_zones, std::uint64_t seed) {
    RevenueTable table;
    if (num_zones <= 0) {
        return table;
    }

    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> base_dist(8.0, 25.0);
    std::vector<double> base(static_cast<std::size_t>(num_zones));
    for (double& b : base) {
        b = base_dist(rng);
    }

    for (int day = 0; day < 7; ++day) {
        const double day_factor = 1.0 + 0.1 * std::sin((day / 7.0) * 2.0 * kPi);
        for (int hour = 0; hour < 24; ++hour) {
            const double tod_factor = 1.0 + 0.2 * std::sin((hour / 24.0) * 2.0 * kPi);
            for (int k = 0; k < num_zones; ++k) {
                RevenueRow row;
                row.day = day;
                row.time_h = static_cast<double>(hour);
                row.weather = "clear";
                row.zone_id = k;
                row.expected_revenue = base[k] * tod_factor * day_factor;
                table.addRow(row);
            }
        }
    }
    return table;
}

} // namespace data
} // namespace taxisim

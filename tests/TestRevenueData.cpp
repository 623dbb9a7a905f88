#include <cmath>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../data/revenue_csv.h"
#include "../data/revenue_table.h"

namespace {

// Always-on requirement: never compiled out in Release.
#define REQUIRE(cond, msg)                                                      \
    do {                                                                        \
        if (!(cond)) {                                                          \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ << " " << msg \
                      << "\n";                                                  \
            std::exit(1);                                                       \
        }                                                                       \
    } while (0)

static inline bool near(double a, double b, double tol = 1e-9) {
    return std::fabs(a - b) <= tol;
}

using taxisim::data::RevenueContext;
using taxisim::data::RevenueRow;
using taxisim::data::RevenueTable;
using taxisim::data::ZeroRevenuePolicy;

static RevenueRow makeRow(int day, double time_h, const std::string& weather, int zone, double revenue) {
    RevenueRow r;
    r.day = day;
    r.time_h = time_h;
    r.weather = weather;
    r.zone_id = zone;
    r.expected_revenue = revenue;
    return r;
}

static RevenueContext makeContext(int day, double time_h, const std::string& weather = "clear") {
    RevenueContext c;
    c.day = day;
    c.time_h = time_h;
    c.weather = weather;
    return c;
}

template <typename Fn>
static bool throwsRuntimeError(Fn fn, const std::string& needle = std::string()) {
    try {
        fn();
    } catch (const std::runtime_error& e) {
        return needle.empty() || std::string(e.what()).find(needle) != std::string::npos;
    }
    return false;
}

// ============================================================
// Table invariants
// ============================================================

static void runCircularHourDistance_R1() {
    using taxisim::data::circularHourDistance;
    REQUIRE(near(circularHourDistance(23.5, 0.5), 1.0), "R1: 23.5 -> 0.5 should be 1 h apart");
    REQUIRE(near(circularHourDistance(1.0, 3.0), 2.0), "R1: 1 -> 3 should be 2 h apart");
    REQUIRE(near(circularHourDistance(0.0, 12.0), 12.0), "R1: antipodal hours should be 12 h apart");
    REQUIRE(near(circularHourDistance(5.0, 5.0), 0.0), "R1: identical hours should be 0 apart");
    std::cout << "[PASS] R1 circular hour distance\n";
}

static void runRowSanitizing_R2() {
    RevenueTable table;
    table.addRow(makeRow(8, 25.0, " RAIN ", 0, -3.0));
    table.addRow(makeRow(0, 0.0, "clear", -1, 50.0));
    table.addRow(makeRow(0, -1.0, "clear", 2, std::nan("")));

    REQUIRE(table.size() == 2, "R2: negative zone id should be dropped");
    const auto& rows = table.rows();
    REQUIRE(rows[0].day == 1, "R2: day should wrap into [0,7)");
    REQUIRE(near(rows[0].time_h, 1.0), "R2: time should wrap into [0,24)");
    REQUIRE(rows[0].weather == "rain", "R2: weather should be trimmed and lower-cased");
    REQUIRE(rows[0].expected_revenue == 0.0, "R2: negative revenue should be stored as 0");
    REQUIRE(near(rows[1].time_h, 23.0), "R2: negative time should wrap");
    REQUIRE(rows[1].expected_revenue == 0.0, "R2: NaN revenue should be stored as 0");

    REQUIRE(table.zoneCount() == 3, "R2: zoneCount should be max id + 1");
    REQUIRE(table.hasZone(0) && !table.hasZone(1) && table.hasZone(2), "R2: hasZone mismatch");

    table.clear();
    REQUIRE(table.empty() && table.zoneCount() == 0, "R2: clear() should empty the table");
    std::cout << "[PASS] R2 row sanitizing and zone bookkeeping\n";
}

static void runSubsetResolution_R3() {
    RevenueTable table;
    table.addRow(makeRow(0, 0.0, "rain", 0, 5.0));
    table.addRow(makeRow(0, 0.0, "clear", 0, 7.0));
    table.addRow(makeRow(1, 0.0, "clear", 0, 9.0));

    REQUIRE(near(table.lookup(makeContext(0, 0.0, "rain"), 1)[0], 5.0), "R3: day+weather subset");
    REQUIRE(near(table.lookup(makeContext(0, 0.0, " Clear "), 1)[0], 7.0), "R3: weather should be normalized");
    REQUIRE(near(table.lookup(makeContext(1, 0.0, "rain"), 1)[0], 9.0), "R3: day-only subset");
    // Day 0 with unknown weather: both day-0 rows tie on distance, first row wins.
    REQUIRE(near(table.lookup(makeContext(0, 0.0, "snow"), 1)[0], 5.0), "R3: day-only tie should keep first row");
    // Day with no rows: whole table, first row wins the tie.
    REQUIRE(near(table.lookup(makeContext(3, 0.0, "clear"), 1)[0], 5.0), "R3: whole-table subset");
    std::cout << "[PASS] R3 day/weather subset resolution\n";
}

static void runNearestCircularTime_R4() {
    RevenueTable table;
    table.addRow(makeRow(0, 1.0, "clear", 0, 10.0));
    table.addRow(makeRow(0, 23.0, "clear", 0, 20.0));
    table.addRow(makeRow(0, 12.0, "clear", 0, 30.0));

    REQUIRE(near(table.lookup(makeContext(0, 23.9), 1)[0], 20.0), "R4: 23.0 is nearer to 23.9 than 1.0");
    REQUIRE(near(table.lookup(makeContext(0, 0.0), 1)[0], 10.0), "R4: equal distance keeps the first row");
    REQUIRE(near(table.lookup(makeContext(0, 11.0), 1)[0], 30.0), "R4: nearest row at midday");
    REQUIRE(near(table.lookup(makeContext(0, 24.5), 1)[0], 10.0), "R4: context time should wrap");
    std::cout << "[PASS] R4 nearest circular time\n";
}

static void runFallbackChain_R5() {
    RevenueTable table;
    table.addRow(makeRow(0, 0.0, "clear", 0, 10.0));
    table.addRow(makeRow(0, 12.0, "clear", 0, 20.0));
    table.addRow(makeRow(1, 0.0, "clear", 2, 6.0));

    // Zone means: 15 and 6; mean of zone means = 10.5.
    REQUIRE(near(table.zoneMean(0), 15.0), "R5: zone 0 mean");
    REQUIRE(near(table.globalMean(), 10.5), "R5: global mean is the mean of zone means");
    REQUIRE(near(table.zoneMean(1), 10.5), "R5: zone without rows falls back to global mean");

    const auto rev = table.lookup(makeContext(0, 0.0), 4);
    REQUIRE(rev.size() == 4, "R5: lookup length must equal num_zones");
    REQUIRE(near(rev[0], 10.0), "R5: zone 0 resolved from the day subset");
    REQUIRE(near(rev[1], 10.5), "R5: zone 1 has no rows -> global mean");
    REQUIRE(near(rev[2], 6.0), "R5: zone 2 missing from subset -> zone mean");
    REQUIRE(near(rev[3], 10.5), "R5: zone beyond the table -> global mean");

    const auto narrow = table.lookup(makeContext(0, 0.0), 1);
    REQUIRE(narrow.size() == 1, "R5: lookup truncates to num_zones");

    RevenueTable empty;
    const auto zeros = empty.lookup(makeContext(0, 0.0), 3);
    REQUIRE(zeros.size() == 3 && zeros[0] == 0.0 && zeros[2] == 0.0, "R5: empty table yields zeros");
    std::cout << "[PASS] R5 fallback chain\n";
}

static void runZeroRevenuePolicy_R6() {
    RevenueTable table;
    table.addRow(makeRow(0, 0.0, "clear", 0, 0.0));
    table.addRow(makeRow(0, 12.0, "clear", 0, 8.0));

    REQUIRE(table.zeroRevenuePolicy() == ZeroRevenuePolicy::TreatZeroAsMissing, "R6: default policy");
    REQUIRE(near(table.lookup(makeContext(0, 0.0), 1)[0], 4.0), "R6: resolved zero should fall back to zone mean");

    table.setZeroRevenuePolicy(ZeroRevenuePolicy::KeepZero);
    REQUIRE(table.lookup(makeContext(0, 0.0), 1)[0] == 0.0, "R6: KeepZero keeps the resolved zero");

    for (double h = 0.0; h < 24.0; h += 0.5) {
        for (double v : table.lookup(makeContext(3, h), 2)) {
            REQUIRE(v >= 0.0 && std::isfinite(v), "R6: lookup values must be finite and non-negative");
        }
    }
    std::cout << "[PASS] R6 zero-revenue policy\n";
}

static void runSyntheticTable_R7() {
    const auto a = taxisim::data::makeSyntheticRevenueTable(6, 12345u);
    const auto b = taxisim::data::makeSyntheticRevenueTable(6, 12345u);
    REQUIRE(a.size() == 7u * 24u * 6u, "R7: one row per day, hour and zone");
    REQUIRE(a.zoneCount() == 6, "R7: zone count");

    const double lo = 8.0 * 0.8 * 0.9;
    const double hi = 25.0 * 1.2 * 1.1;
    for (std::size_t i = 0; i < a.size(); ++i) {
        const auto& r = a.rows()[i];
        REQUIRE(r.expected_revenue > lo - 1e-9 && r.expected_revenue < hi + 1e-9, "R7: revenue out of range");
        REQUIRE(r.expected_revenue == b.rows()[i].expected_revenue, "R7: same seed must reproduce the table");
        REQUIRE(r.weather == "clear", "R7: synthetic weather");
    }
    REQUIRE(taxisim::data::makeSyntheticRevenueTable(0).empty(), "R7: zero zones -> empty table");
    std::cout << "[PASS] R7 synthetic table\n";
}

// ============================================================
// CSV ingestion
// ============================================================

static void runLongCsvWithAliases_C1() {
    std::istringstream in(
        "Unnamed: 0,Day,Time,Weather,cluster_id,rev\n"
        "0,0,8.0,Rain,10,12.5\n"
        "1,0,8.0,rain,2,4.0\n"
        "\n"
        "2,1,9.5,,10,n/a\n");
    const RevenueTable table = taxisim::data::parseRevenueCSV(in, "long.csv");

    REQUIRE(table.size() == 3, "C1: three data rows");
    REQUIRE(table.zoneCount() == 2, "C1: two distinct cluster labels");
    const auto& rows = table.rows();
    // Numeric labels are ordered numerically: "2" -> 0, "10" -> 1.
    REQUIRE(rows[0].zone_id == 1 && rows[1].zone_id == 0, "C1: numeric labels sorted ascending");
    REQUIRE(rows[0].weather == "rain", "C1: weather normalized");
    REQUIRE(rows[2].weather == "clear", "C1: empty weather cell defaults to clear");
    REQUIRE(rows[2].expected_revenue == 0.0, "C1: unparsable revenue -> 0");
    REQUIRE(near(rows[2].time_h, 9.5) && rows[2].day == 1, "C1: day/time parsed");
    std::cout << "[PASS] C1 long CSV with aliases\n";
}

static void runWideCsv_C2() {
    std::istringstream in(
        "weekday,hour,0,1,2\n"
        "0,8,5,6,x\n"
        "0,26,1,2,3\n");
    const RevenueTable table = taxisim::data::parseRevenueCSV(in, "wide.csv");

    REQUIRE(table.size() == 6, "C2: wide rows melted to one row per zone");
    REQUIRE(table.zoneCount() == 3, "C2: three zone columns");
    const auto& rows = table.rows();
    REQUIRE(rows[0].zone_id == 0 && near(rows[0].expected_revenue, 5.0), "C2: zone 0 value");
    REQUIRE(rows[2].zone_id == 2 && rows[2].expected_revenue == 0.0, "C2: unparsable cell -> 0");
    REQUIRE(rows[0].weather == "clear", "C2: missing weather column -> clear");
    REQUIRE(near(rows[3].time_h, 2.0), "C2: time taken mod 24");
    std::cout << "[PASS] C2 wide CSV\n";
}

static void runFirstAppearanceLabels_C3() {
    std::istringstream in(
        "day,time,cluster,expected_revenue\n"
        "0,0,north,1\n"
        "0,0,airport,2\n"
        "0,1,north,3\n");
    const RevenueTable table = taxisim::data::parseRevenueCSV(in);
    const auto& rows = table.rows();
    REQUIRE(rows[0].zone_id == 0 && rows[1].zone_id == 1 && rows[2].zone_id == 0,
            "C3: non-numeric labels mapped in first-appearance order");
    std::cout << "[PASS] C3 non-numeric label mapping\n";
}

static void runCsvErrors_C4() {
    REQUIRE(throwsRuntimeError([] {
        std::istringstream in("");
        taxisim::data::parseRevenueCSV(in, "empty.csv");
    }, "empty"), "C4: empty input should throw");

    REQUIRE(throwsRuntimeError([] {
        std::istringstream in("day,cluster,expected_revenue\n0,1,2\n");
        taxisim::data::parseRevenueCSV(in, "notime.csv");
    }, "missing required columns: time"), "C4: missing time column should throw");

    REQUIRE(throwsRuntimeError([] {
        std::istringstream in("day,time,cluster,expected_revenue\nmonday,0,1,2\n");
        taxisim::data::parseRevenueCSV(in, "bad.csv");
    }, "bad.csv:2"), "C4: malformed day should name source and line");

    REQUIRE(throwsRuntimeError([] {
        std::istringstream in("day,time,cluster,expected_revenue\n1e12,0,1,2\n");
        taxisim::data::parseRevenueCSV(in, "huge.csv");
    }, "malformed day '1e12' at huge.csv:2"), "C4: day outside the int range should throw");

    REQUIRE(throwsRuntimeError([] {
        std::istringstream in("weekday,hour,0,1\n-1e300,0,5,6\n");
        taxisim::data::parseRevenueCSV(in, "wide.csv");
    }, "malformed day"), "C4: wide layout rejects out-of-range days too");

    REQUIRE(throwsRuntimeError([] {
        taxisim::data::loadRevenueCSV("/nonexistent/dir/revenue.csv");
    }, "cannot open"), "C4: unreadable file should throw");
    std::cout << "[PASS] C4 CSV error reporting\n";
}

} // namespace

int main() {
    runCircularHourDistance_R1();
    runRowSanitizing_R2();
    runSubsetResolution_R3();
    runNearestCircularTime_R4();
    runFallbackChain_R5();
    runZeroRevenuePolicy_R6();
    runSyntheticTable_R7();

    runLongCsvWithAliases_C1();
    runWideCsv_C2();
    runFirstAppearanceLabels_C3();
    runCsvErrors_C4();

    return 0;
}

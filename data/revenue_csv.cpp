// data/revenue_csv.cpp

#include "revenue_csv.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <map>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace taxisim {
namespace data {

namespace {

struct RawRecord {
    int day = 0;
    double time_h = 0.0;
    std::string weather;
    std::string zone_label;
    double revenue = 0.0;
};

std::string trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::vector<std::string> splitCsvLine(const std::string& line) {
    std::vector<std::string> out;
    std::string cur;
    bool quoted = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (c == '"') {
            if (quoted && i + 1 < line.size() && line[i + 1] == '"') {
                cur.push_back('"');
                ++i;
            } else {
                quoted = !quoted;
            }
        } else if (c == ',' && !quoted) {
            out.push_back(trim(cur));
            cur.clear();
        } else if (c != '\r') {
            cur.push_back(c);
        }
    }
    out.push_back(trim(cur));
    return out;
}

bool isDigits(const std::string& s) {
    if (s.empty()) return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool parseDouble(const std::string& s, double& out) {
    if (s.empty()) return false;
    std::size_t used = 0;
    try {
        out = std::stod(s, &used);
    } catch (const std::exception&) {
        return false;
    }
    return used == s.size() && std::isfinite(out);
}

std::string where(const std::string& source, int line_no) {
    std::ostringstream oss;
    oss << source << ":" << line_no;
    return oss.str();
}

// Lower-case + trim, then apply aliases only where the canonical name is absent.
std::vector<std::string> normalizeHeader(const std::vector<std::string>& raw) {
    std::vector<std::string> cols;
    cols.reserve(raw.size());
    for (const auto& c : raw) {
        cols.push_back(normalizeWeather(c));
    }

    static const std::pair<const char*, const char*> kAliases[] = {
        {"cluster_id", "cluster"},
        {"rev", "expected_revenue"},
        {"expected revenue", "expected_revenue"},
        {"weekday", "day"},
        {"hour", "time"},
        {"tod", "time"},
    };
    for (const auto& alias : kAliases) {
        const bool has_new = std::find(cols.begin(), cols.end(), alias.second) != cols.end();
        if (has_new) continue;
        auto it = std::find(cols.begin(), cols.end(), alias.first);
        if (it != cols.end()) {
            *it = alias.second;
        }
    }
    return cols;
}

int findColumn(const std::vector<std::string>& cols, const char* name) {
    auto it = std::find(cols.begin(), cols.end(), name);
    return it == cols.end() ? -1 : static_cast<int>(it - cols.begin());
}

const std::string& cell(const std::vector<std::string>& fields, int col) {
    static const std::string kEmpty;
    if (col < 0 || static_cast<std::size_t>(col) >= fields.size()) return kEmpty;
    return fields[static_cast<std::size_t>(col)];
}

std::map<std::string, int> buildZoneMapping(const std::vector<RawRecord>& records) {
    std::vector<std::string> order;
    std::map<std::string, int> seen;
    bool all_numeric = true;
    for (const auto& r : records) {
        if (seen.emplace(r.zone_label, 0).second) {
            order.push_back(r.zone_label);
            double v = 0.0;
            if (!parseDouble(r.zone_label, v)) all_numeric = false;
        }
    }

    if (all_numeric) {
        std::stable_sort(order.begin(), order.end(), [](const std::string& a, const std::string& b) {
            return std::stod(a) < std::stod(b);
        });
    }

    std::map<std::string, int> mapping;
    for (std::size_t i = 0; i < order.size(); ++i) {
        mapping[order[i]] = static_cast<int>(i);
    }
    return mapping;
}

} // namespace

RevenueTable parseRevenueCSV(std::istream& in, const std::string& source_name) {
    std::string line;
    int line_no = 0;

    // Header: first non-empty line.
    std::vector<std::string> cols;
    while (std::getline(in, line)) {
        ++line_no;
        if (!trim(line).empty()) {
            cols = normalizeHeader(splitCsvLine(line));
            break;
        }
    }
    if (cols.empty()) {
        throw std::runtime_error("revenue table " + source_name + " is empty");
    }

    const int c_day = findColumn(cols, "day");
    const int c_time = findColumn(cols, "time");
    const int c_weather = findColumn(cols, "weather");
    const int c_cluster = findColumn(cols, "cluster");
    const int c_rev = findColumn(cols, "expected_revenue");

    std::vector<int> zone_cols;
    for (std::size_t i = 0; i < cols.size(); ++i) {
        if (cols[i].rfind("unnamed:", 0) == 0) continue;
        if (isDigits(cols[i])) zone_cols.push_back(static_cast<int>(i));
    }
    const bool wide = !zone_cols.empty();

    std::vector<std::string> missing;
    if (c_day < 0) missing.push_back("day");
    if (c_time < 0) missing.push_back("time");
    if (!wide) {
        if (c_cluster < 0) missing.push_back("cluster");
        if (c_rev < 0) missing.push_back("expected_revenue");
    }
    if (!missing.empty()) {
        std::string msg = "revenue table " + source_name + " is missing required columns:";
        for (const auto& m : missing) msg += " " + m;
        throw std::runtime_error(msg);
    }

    std::vector<RawRecord> records;
    while (std::getline(in, line)) {
        ++line_no;
        if (trim(line).empty()) continue;
        const std::vector<std::string> fields = splitCsvLine(line);

        double day_v = 0.0;
        if (!parseDouble(cell(fields, c_day), day_v) ||
            day_v < static_cast<double>(std::numeric_limits<int>::min()) ||
            day_v > static_cast<double>(std::numeric_limits<int>::max())) {
            throw std::runtime_error("malformed day '" + cell(fields, c_day) + "' at " + where(source_name, line_no));
        }
        double time_v = 0.0;
        if (!parseDouble(cell(fields, c_time), time_v)) {
            throw std::runtime_error("malformed time '" + cell(fields, c_time) + "' at " + where(source_name, line_no));
        }

        RawRecord base;
        base.day = static_cast<int>(day_v);
        base.time_h = time_v;
        base.weather = c_weather >= 0 ? cell(fields, c_weather) : std::string();
        if (base.weather.empty()) base.weather = "clear";

        if (wide) {
            for (int zc : zone_cols) {
                RawRecord r = base;
                r.zone_label = cols[static_cast<std::size_t>(zc)];
                if (!parseDouble(cell(fields, zc), r.revenue)) r.revenue = 0.0;
                records.push_back(r);
            }
        } else {
            RawRecord r = base;
            r.zone_label = cell(fields, c_cluster);
            if (!parseDouble(cell(fields, c_rev), r.revenue)) r.revenue = 0.0;
            records.push_back(r);
        }
    }

    const std::map<std::string, int> mapping = buildZoneMapping(records);

    RevenueTable table;
    for (const auto& r : records) {
        RevenueRow row;
        row.day = r.day;
        row.time_h = r.time_h;
        row.weather = r.weather;
        row.zone_id = mapping.at(r.zone_label);
        row.expected_revenue = r.revenue;
        table.addRow(row);
    }
    return table;
}

RevenueTable loadRevenueCSV(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("cannot open revenue table: " + path);
    }
    return parseRevenueCSV(in, path);
}

} // namespace data
} // namespace taxisim

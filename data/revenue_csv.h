#pragma once

// data/revenue_csv.h
//
// CSV ingestion for RevenueTable.
//
// Accepted layouts (header names are trimmed and lower-cased):
//   long:  day, time, [weather], cluster, expected_revenue
//   wide:  day, time, [weather], 0, 1, 2, ...   (one column per zone)
//
// Aliases: cluster_id -> cluster, rev / "expected revenue" -> expected_revenue,
//          weekday -> day, hour / tod -> time. Columns named "unnamed:*"
//          (spreadsheet index artifacts) are ignored.
//
// Missing weather column -> "clear". Unparsable revenue -> 0.
// Zone labels are remapped to contiguous ids 0..K-1: ascending numeric order
// when every label is numeric, first-appearance order otherwise.
//
// Errors (unreadable file, missing required columns, malformed day/time)
// throw std::runtime_error naming the source and line.

#include "revenue_table.h"

#include <istream>
#include <string>

namespace taxisim {
namespace data {

RevenueTable parseRevenueCSV(std::istream& in, const std::string& source_name = "<stream>");
RevenueTable loadRevenueCSV(const std::string& path);

} // namespace data
} // namespace taxisim

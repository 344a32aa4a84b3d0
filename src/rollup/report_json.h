// JSON serialization of rollup reports.

#ifndef DIRSTAT_ROLLUP_REPORT_JSON_H
#define DIRSTAT_ROLLUP_REPORT_JSON_H

#include <string>

#include "core/json_helpers.h"
#include "rollup/rollup_report.h"

namespace dirstat {

/// @brief Write one distribution as a JSON object.
///
/// A non-finite palma ratio is written as null.
void writeDistribution(JsonWriter& writer, const MetricDistribution& dist);

/// @brief Write one directory scope (direct or recursive) as a JSON object.
void writeDirectoryStats(JsonWriter& writer, const DirectoryStats& stats);

/// @brief Serialize a complete report.
///
/// Field order is fixed and maps are written in key order, so identical
/// reports always serialize to identical text.
///
/// @param report The report to serialize.
/// @param pretty Indent the output (2 spaces) instead of a single line.
/// @return JSON text.
std::string reportToJson(const RollupReport& report, bool pretty = true);

}  // namespace dirstat

#endif  // DIRSTAT_ROLLUP_REPORT_JSON_H

// Consistency checks over a finished rollup report.

#ifndef DIRSTAT_VALIDATE_REPORT_VALIDATOR_H
#define DIRSTAT_VALIDATE_REPORT_VALIDATOR_H

#include <string>
#include <vector>

#include "cost/cocomo.h"
#include "rollup/rollup_report.h"

namespace dirstat {

// Check identifiers.
namespace check {
constexpr const char* kRecursiveFileCount = "recursive_file_count";
constexpr const char* kRecursiveMetricSum = "recursive_metric_sum";
constexpr const char* kPercentileOrder = "percentile_order";
constexpr const char* kMeanBounds = "mean_bounds";
constexpr const char* kInequalityBounds = "inequality_bounds";
constexpr const char* kNonNegative = "non_negative";
constexpr const char* kDirectFileCountTotal = "direct_file_count_total";
constexpr const char* kStructure = "structure";
constexpr const char* kClassificationTotal = "classification_total";
constexpr const char* kLanguageTotal = "language_total";
constexpr const char* kCocomoMonotonic = "cocomo_monotonic";
}  // namespace check

/// Relative tolerance for comparing sums accumulated in different orders.
constexpr double kSumTolerance = 1e-9;

/// A single failed check.
struct Violation {
  std::string check_id;
  std::string path;    ///< Directory path, preset name, or empty.
  std::string metric;  ///< Metric or field involved, may be empty.
  double expected = 0.0;
  double actual = 0.0;
  std::string message;
};

/// @brief Result of validateReport(): every violation plus the checks that ran.
struct ValidationReport {
  std::vector<Violation> violations;
  std::vector<std::string> checks_run;

  /// @brief True if no check reported a violation.
  bool passed() const { return violations.empty(); }

  /// @brief Violations reported by one check.
  std::vector<Violation> violationsFor(const std::string& check_id) const;

  /// @brief Serialize the validation result to a JSON string.
  std::string toJson() const;
};

/// @brief Run every consistency check over a report.
///
/// Checks are independent: a failing check never stops the others.
///
/// @param report Report to verify.
/// @param presets Preset table the report's cost estimates were made with;
///        supplies the wages for the cost monotonicity check.
ValidationReport validateReport(const RollupReport& report, const CocomoPresetTable& presets);

}  // namespace dirstat

#endif  // DIRSTAT_VALIDATE_REPORT_VALIDATOR_H

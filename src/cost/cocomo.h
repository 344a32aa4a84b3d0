// COCOMO-style effort and cost estimation with organizational presets.

#ifndef DIRSTAT_COST_COCOMO_H
#define DIRSTAT_COST_COCOMO_H

#include <string>
#include <utility>
#include <vector>

namespace dirstat {

/// @brief Power-law coefficients and wage model for one organization profile.
struct CocomoPreset {
  std::string name;
  double a = 3.0;  ///< Effort multiplier.
  double b = 1.12; ///< Effort exponent on KLOC.
  double c = 2.5;  ///< Schedule multiplier.
  double d = 0.35; ///< Schedule exponent on effort.
  double annual_wage = 0.0;
  double overhead = 1.0;  ///< Fully loaded cost multiplier on wages.
  double eaf = 1.0;       ///< Effort adjustment factor.
  std::string description;

  /// @brief Fully loaded cost of one person-month: annual_wage / 12 * overhead.
  double monthlyWage() const { return annual_wage / 12.0 * overhead; }
};

/// @brief Estimate for one preset.
struct CocomoEstimate {
  double effort_person_months = 0.0;
  double schedule_months = 0.0;
  double people = 0.0;
  double cost = 0.0;
};

/// Ordered preset table, cheapest organization first.
using CocomoPresetTable = std::vector<CocomoPreset>;

/// @brief Built-in preset table.
///
/// early_startup, growth_startup, scale_up, sme, mid_market,
/// large_enterprise, regulated, open_source. open_source has zero wage.
CocomoPresetTable defaultCocomoPresets();

/// @brief Find a preset by name.
/// @return Pointer into `table`, or nullptr if absent.
const CocomoPreset* findPreset(const CocomoPresetTable& table, const std::string& name);

/// @brief Estimate effort, schedule, headcount and cost.
///
/// effort = a * kloc^b * eaf; schedule = c * effort^d;
/// people = effort / schedule; cost = effort * monthlyWage().
/// @param kloc Thousands of lines of code. Values <= 0 give an all-zero estimate.
CocomoEstimate estimateCocomo(double kloc, const CocomoPreset& preset);

/// @brief Estimate every preset in table order.
std::vector<std::pair<std::string, CocomoEstimate>> estimateAll(
    double kloc, const CocomoPresetTable& table);

}  // namespace dirstat

#endif  // DIRSTAT_COST_COCOMO_H

// COCOMO estimation.

#include "cost/cocomo.h"

#include <cmath>

namespace dirstat {
namespace {

CocomoPreset makePreset(const char* name, double a, double b, double c, double d,
                        double annual_wage, double overhead, double eaf,
                        const char* description) {
  CocomoPreset preset;
  preset.name = name;
  preset.a = a;
  preset.b = b;
  preset.c = c;
  preset.d = d;
  preset.annual_wage = annual_wage;
  preset.overhead = overhead;
  preset.eaf = eaf;
  preset.description = description;
  return preset;
}

}  // namespace

CocomoPresetTable defaultCocomoPresets() {
  return {
      makePreset("early_startup",    2.0, 1.00, 2.2, 0.40, 150000, 1.5, 0.8,
                 "< 10 employees, flat structure, no bureaucracy"),
      makePreset("growth_startup",   2.4, 1.05, 2.5, 0.38, 140000, 1.8, 0.9,
                 "10-50 employees, adding process"),
      makePreset("scale_up",         2.8, 1.08, 2.5, 0.36, 130000, 2.2, 1.0,
                 "50-200 employees, formal processes emerging"),
      makePreset("sme",              3.0, 1.12, 2.5, 0.35, 120000, 2.4, 1.0,
                 "200-500 employees, established processes"),
      makePreset("mid_market",       3.2, 1.15, 2.5, 0.34, 115000, 2.6, 1.1,
                 "500-2000 employees, compliance overhead"),
      makePreset("large_enterprise", 3.6, 1.20, 2.5, 0.32, 110000, 3.0, 1.2,
                 "2000+ employees, heavy governance"),
      makePreset("regulated",        4.0, 1.25, 2.8, 0.30, 120000, 3.5, 1.5,
                 "Finance, healthcare, defense, government"),
      makePreset("open_source",      2.0, 1.00, 3.0, 0.42, 0,      1.0, 0.5,
                 "Volunteer effort, no wage cost"),
  };
}

const CocomoPreset* findPreset(const CocomoPresetTable& table, const std::string& name) {
  for (const auto& preset : table) {
    if (preset.name == name) return &preset;
  }
  return nullptr;
}

CocomoEstimate estimateCocomo(double kloc, const CocomoPreset& preset) {
  CocomoEstimate estimate;
  if (!(kloc > 0.0)) return estimate;

  estimate.effort_person_months = preset.a * std::pow(kloc, preset.b) * preset.eaf;
  estimate.schedule_months = preset.c * std::pow(estimate.effort_person_months, preset.d);
  estimate.people = estimate.schedule_months > 0.0
                        ? estimate.effort_person_months / estimate.schedule_months
                        : 0.0;
  estimate.cost = estimate.effort_person_months * preset.monthlyWage();
  return estimate;
}

std::vector<std::pair<std::string, CocomoEstimate>> estimateAll(
    double kloc, const CocomoPresetTable& table) {
  std::vector<std::pair<std::string, CocomoEstimate>> result;
  result.reserve(table.size());
  for (const auto& preset : table) {
    result.emplace_back(preset.name, estimateCocomo(kloc, preset));
  }
  return result;
}

}  // namespace dirstat

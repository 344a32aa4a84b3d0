// Engine configuration: rollup options, classification rules, COCOMO presets.

#ifndef DIRSTAT_CONFIG_ENGINE_CONFIG_H
#define DIRSTAT_CONFIG_ENGINE_CONFIG_H

#include <string>
#include <string_view>

#include "core/json_parser.h"
#include "cost/cocomo.h"
#include "rollup/rollup_aggregator.h"
#include "tree/classifier.h"

namespace dirstat {

/// @brief Everything a rollup run is parameterized by.
///
/// Rule and preset tables are values, not globals, so tests and callers can
/// substitute alternate tables.
struct EngineConfig {
  RollupConfig rollup;
  ClassificationRules classification = ClassificationRules::defaults();
  CocomoPresetTable presets = defaultCocomoPresets();
};

/// @brief Apply a parsed JSON configuration on top of `config`.
///
/// Recognized keys (all optional):
///   "tracked_metrics": ["lines_code", ...]
///   "loc_metric": "lines_code"
///   "strategy": "bottom_up" | "ancestor_closure"
///   "presets": [{"name": ..., "a": ..., "b": ..., "c": ..., "d": ...,
///                "annual_wage": ..., "overhead": ..., "eaf": ...,
///                "description": ...}, ...]   (replaces the whole table)
/// Unknown keys are ignored.
///
/// @return False with `error` set on a wrongly typed or invalid value;
///         `config` is left unchanged in that case.
bool applyConfigJson(const JsonValue& root, EngineConfig& config, std::string* error);

/// @brief Parse JSON text and apply it (see applyConfigJson).
bool loadConfigFromJson(std::string_view text, EngineConfig& config, std::string* error);

/// @brief Check an assembled configuration.
///
/// Requires a non-empty loc metric, unique non-empty preset names, and
/// non-negative wages/overheads with positive a, c coefficients.
bool validateEngineConfig(const EngineConfig& config, std::string* error);

}  // namespace dirstat

#endif  // DIRSTAT_CONFIG_ENGINE_CONFIG_H

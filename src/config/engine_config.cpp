// Engine configuration loading and validation.

#include "config/engine_config.h"

#include <set>

namespace dirstat {
namespace {

bool setError(std::string* error, const std::string& message) {
  if (error) *error = message;
  return false;
}

/// @brief Read an optional numeric preset field.
bool readNumber(const JsonValue& obj, const char* name, double& out, std::string* error) {
  const JsonValue* field = obj.find(name);
  if (!field) return true;
  if (!field->isNumber()) {
    return setError(error, std::string("preset field '") + name + "' must be a number");
  }
  out = field->asDouble();
  return true;
}

bool presetFromJson(const JsonValue& obj, CocomoPreset& preset, std::string* error) {
  if (!obj.isObject()) return setError(error, "each preset must be an object");

  const JsonValue* name = obj.find("name");
  if (!name || !name->isString()) return setError(error, "preset requires a string 'name'");
  preset.name = name->string_val;

  if (!readNumber(obj, "a", preset.a, error)) return false;
  if (!readNumber(obj, "b", preset.b, error)) return false;
  if (!readNumber(obj, "c", preset.c, error)) return false;
  if (!readNumber(obj, "d", preset.d, error)) return false;
  if (!readNumber(obj, "annual_wage", preset.annual_wage, error)) return false;
  if (!readNumber(obj, "overhead", preset.overhead, error)) return false;
  if (!readNumber(obj, "eaf", preset.eaf, error)) return false;

  if (const JsonValue* desc = obj.find("description")) {
    preset.description = desc->asString();
  }
  return true;
}

}  // namespace

bool applyConfigJson(const JsonValue& root, EngineConfig& config, std::string* error) {
  if (!root.isObject()) return setError(error, "configuration must be a JSON object");

  EngineConfig updated = config;

  if (const JsonValue* tracked = root.find("tracked_metrics")) {
    if (!tracked->isArray()) return setError(error, "'tracked_metrics' must be an array");
    updated.rollup.tracked_metrics.clear();
    for (const auto& item : tracked->array_val) {
      if (!item.isString()) {
        return setError(error, "'tracked_metrics' entries must be strings");
      }
      updated.rollup.tracked_metrics.push_back(item.string_val);
    }
  }

  if (const JsonValue* loc = root.find("loc_metric")) {
    if (!loc->isString()) return setError(error, "'loc_metric' must be a string");
    updated.rollup.loc_metric = loc->string_val;
  }

  if (const JsonValue* strategy = root.find("strategy")) {
    if (!strategy->isString() ||
        !rollupStrategyFromString(strategy->string_val, updated.rollup.strategy)) {
      return setError(error, "'strategy' must be \"bottom_up\" or \"ancestor_closure\"");
    }
  }

  if (const JsonValue* presets = root.find("presets")) {
    if (!presets->isArray()) return setError(error, "'presets' must be an array");
    CocomoPresetTable table;
    for (const auto& item : presets->array_val) {
      CocomoPreset preset;
      if (!presetFromJson(item, preset, error)) return false;
      table.push_back(preset);
    }
    updated.presets = table;
  }

  if (!validateEngineConfig(updated, error)) return false;
  config = updated;
  return true;
}

bool loadConfigFromJson(std::string_view text, EngineConfig& config, std::string* error) {
  JsonValue root;
  std::string parse_error;
  if (!parseJson(text, root, &parse_error)) {
    return setError(error, "config parse error at " + parse_error);
  }
  return applyConfigJson(root, config, error);
}

bool validateEngineConfig(const EngineConfig& config, std::string* error) {
  if (config.rollup.loc_metric.empty()) return setError(error, "loc metric must not be empty");

  std::set<std::string> names;
  for (const auto& preset : config.presets) {
    if (preset.name.empty()) return setError(error, "preset name must not be empty");
    if (!names.insert(preset.name).second) {
      return setError(error, "duplicate preset '" + preset.name + "'");
    }
    if (!(preset.a > 0.0) || !(preset.c > 0.0)) {
      return setError(error, "preset '" + preset.name + "' needs positive a and c");
    }
    if (preset.annual_wage < 0.0 || preset.overhead < 0.0 || preset.eaf < 0.0) {
      return setError(error, "preset '" + preset.name + "' has a negative wage term");
    }
  }
  return true;
}

}  // namespace dirstat

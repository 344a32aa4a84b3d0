// JSON input reader for file records.

#include "io/record_reader.h"

#include <cmath>
#include <string>
#include <utility>

namespace dirstat {
namespace {

bool readFlag(const JsonValue& obj, const char* name, bool& out, std::string& reason) {
  const JsonValue* field = obj.find(name);
  if (!field || field->isNull()) return true;
  if (!field->isBool()) {
    reason = std::string("flag '") + name + "' must be a boolean";
    return false;
  }
  out = field->asBool(out);
  return true;
}

}  // namespace

bool recordFromJson(const JsonValue& obj, FileRecord& record, RecordError& error) {
  error = RecordError{};
  if (!obj.isObject()) {
    error.kind = RecordErrorKind::MalformedRecord;
    error.reason = "record is not an object";
    return false;
  }

  const JsonValue* path = obj.find("path");
  if (!path || !path->isString()) {
    error.kind = RecordErrorKind::InvalidPath;
    error.reason = "missing or non-string 'path'";
    return false;
  }
  record.path = path->string_val;
  error.path = record.path;

  if (const JsonValue* language = obj.find("language")) {
    if (language->isString() && !language->string_val.empty()) {
      record.language = language->string_val;
    }
  }

  record.metrics.clear();
  if (const JsonValue* metrics = obj.find("metrics")) {
    if (!metrics->isObject()) {
      error.kind = RecordErrorKind::MalformedRecord;
      error.reason = "'metrics' must be an object";
      return false;
    }
    for (const auto& [name, value] : metrics->object_val) {
      if (!value.isNumber() || !std::isfinite(value.number_val)) {
        error.kind = RecordErrorKind::NonNumericMetric;
        error.reason = "metric '" + name + "' is not numeric";
        return false;
      }
      record.metrics[name] = value.asDouble();
    }
  }

  std::string reason;
  const JsonValue* flags = obj.find("flags");
  if (flags && flags->isObject()) {
    if (!readFlag(*flags, "minified", record.flags.is_minified, reason) ||
        !readFlag(*flags, "generated", record.flags.is_generated, reason) ||
        !readFlag(*flags, "binary", record.flags.is_binary, reason)) {
      error.kind = RecordErrorKind::MalformedRecord;
      error.reason = reason;
      return false;
    }
  }
  if (!readFlag(obj, "is_minified", record.flags.is_minified, reason) ||
      !readFlag(obj, "is_generated", record.flags.is_generated, reason) ||
      !readFlag(obj, "is_binary", record.flags.is_binary, reason)) {
    error.kind = RecordErrorKind::MalformedRecord;
    error.reason = reason;
    return false;
  }
  return true;
}

RecordReadResult readRecords(const JsonValue& document) {
  RecordReadResult result;

  const JsonValue* list = nullptr;
  if (document.isArray()) {
    list = &document;
  } else if (document.isObject()) {
    list = document.find("files");
  }
  if (!list || !list->isArray()) {
    result.error_message = "expected an array of records or an object with a 'files' array";
    return result;
  }

  for (const auto& item : list->array_val) {
    FileRecord record;
    RecordError error;
    if (recordFromJson(item, record, error)) {
      result.records.push_back(std::move(record));
    } else {
      result.errors.push_back(std::move(error));
    }
  }
  result.success = true;
  return result;
}

RecordReadResult readRecordsFromJson(std::string_view text) {
  JsonValue document;
  std::string parse_error;
  if (!parseJson(text, document, &parse_error)) {
    RecordReadResult result;
    result.error_message = "input parse error at " + parse_error;
    return result;
  }
  return readRecords(document);
}

}  // namespace dirstat

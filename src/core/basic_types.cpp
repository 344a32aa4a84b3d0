// Basic types implementation.

#include "core/basic_types.h"

namespace dirstat {

double FileRecord::metricOr0(const std::string& name) const {
  auto iter = metrics.find(name);
  return iter != metrics.end() ? iter->second : 0.0;
}

const char* fileClassToString(FileClass cls) {
  switch (cls) {
    case FileClass::Source: return "source";
    case FileClass::Test:   return "test";
    case FileClass::Config: return "config";
    case FileClass::Build:  return "build";
    case FileClass::Ci:     return "ci";
    case FileClass::Docs:   return "docs";
  }
  return "unknown";
}

const char* recordErrorKindToString(RecordErrorKind kind) {
  switch (kind) {
    case RecordErrorKind::InvalidPath:      return "invalid_path";
    case RecordErrorKind::DuplicatePath:    return "duplicate_path";
    case RecordErrorKind::NonNumericMetric: return "non_numeric_metric";
    case RecordErrorKind::NegativeMetric:   return "negative_metric";
    case RecordErrorKind::MalformedRecord:  return "malformed_record";
  }
  return "unknown";
}

}  // namespace dirstat

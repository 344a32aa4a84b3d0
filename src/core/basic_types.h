// Basic types for directory metrics rollup.

#ifndef DIRSTAT_CORE_BASIC_TYPES_H
#define DIRSTAT_CORE_BASIC_TYPES_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace dirstat {

/// Metric name -> value for a single file.
using MetricMap = std::map<std::string, double>;

/// Path of the repository root directory node.
constexpr const char* kRootPath = "/";

// ---------------------------------------------------------------------------
// Well-known metric names
// ---------------------------------------------------------------------------

/// Metric names read by the per-file derived ratios. The engine itself is
/// metric-agnostic; records may carry any other names.
namespace metric {

constexpr const char* kLinesTotal = "lines_total";
constexpr const char* kLinesCode = "lines_code";
constexpr const char* kLinesComment = "lines_comment";
constexpr const char* kLinesBlank = "lines_blank";
constexpr const char* kComplexity = "complexity";
constexpr const char* kBytes = "bytes";
constexpr const char* kUloc = "uloc";

}  // namespace metric

// ---------------------------------------------------------------------------
// File records
// ---------------------------------------------------------------------------

/// Per-file flags reported by the external collector.
struct FileFlags {
  bool is_minified = false;
  bool is_generated = false;
  bool is_binary = false;
};

/// @brief One normalized input file with its metrics.
///
/// Path is repository-relative and '/'-separated. A metric absent from
/// `metrics` counts as 0 wherever the record is aggregated.
struct FileRecord {
  std::string path;
  std::string language = "Unknown";
  MetricMap metrics;
  FileFlags flags;

  /// @brief Get a metric value, or 0 if the record does not carry it.
  double metricOr0(const std::string& name) const;
};

// ---------------------------------------------------------------------------
// Classification
// ---------------------------------------------------------------------------

/// File classification tag. Source means "no rule matched".
enum class FileClass : uint8_t {
  Source,
  Test,
  Config,
  Build,
  Ci,
  Docs
};

/// Number of FileClass values.
constexpr int kFileClassCount = 6;

/// @brief Convert FileClass to its report string ("source", "test", ...).
const char* fileClassToString(FileClass cls);

// ---------------------------------------------------------------------------
// Input errors
// ---------------------------------------------------------------------------

/// Reason a record was rejected.
enum class RecordErrorKind : uint8_t {
  InvalidPath,       ///< Absolute, '..', bad separator or empty segment.
  DuplicatePath,     ///< Path already seen earlier in the input.
  NonNumericMetric,  ///< Metric value is not a finite number.
  NegativeMetric,    ///< Metric value is below zero.
  MalformedRecord    ///< Record is not an object or lacks required fields.
};

/// @brief Convert RecordErrorKind to snake_case string.
const char* recordErrorKindToString(RecordErrorKind kind);

/// A single rejected input record.
struct RecordError {
  std::string path;
  RecordErrorKind kind = RecordErrorKind::InvalidPath;
  std::string reason;
};

}  // namespace dirstat

#endif  // DIRSTAT_CORE_BASIC_TYPES_H

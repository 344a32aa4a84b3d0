// Rollup report: directories, files and repository summary.

#ifndef DIRSTAT_ROLLUP_ROLLUP_REPORT_H
#define DIRSTAT_ROLLUP_ROLLUP_REPORT_H

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "config/engine_config.h"
#include "core/basic_types.h"
#include "cost/cocomo.h"
#include "rollup/directory_stats.h"
#include "rollup/rollup_aggregator.h"
#include "stats/distribution.h"

namespace dirstat {

/// Version of the report layout, bumped on any field change.
constexpr const char* kSchemaVersion = "2.1";

/// @brief One file of the report with derived ratios.
///
/// Carries the record's metrics and flags, so recordsFromReport() can feed
/// a report's file list back through the engine.
struct FileEntry {
  std::string path;
  std::string filename;
  std::string directory;
  std::string language;
  std::string extension;
  MetricMap metrics;
  FileFlags flags;
  FileClass classification = FileClass::Source;

  double comment_ratio = 0.0;       ///< lines_comment / lines_total.
  double blank_ratio = 0.0;         ///< lines_blank / lines_total.
  double code_ratio = 0.0;          ///< lines_code / lines_total.
  double complexity_density = 0.0;  ///< complexity / lines_code.
  double dryness = 0.0;             ///< uloc / lines_code.
  double bytes_per_loc = 0.0;       ///< bytes / lines_code.
};

/// Shape of the directory tree.
struct StructureStats {
  int max_depth = 0;
  double avg_depth = 0.0;
  uint64_t leaf_directory_count = 0;
  double avg_files_per_directory = 0.0;
};

/// Repository-wide language mix.
struct LanguageSummary {
  std::map<std::string, uint64_t> by_files;
  std::map<std::string, double> by_loc;
  std::string dominant_language = "Unknown";  ///< Most code; ties by name.
  double dominant_language_pct = 0.0;
  double polyglot_score = 0.0;  ///< 1 - dominant_language_pct.
  std::vector<std::string> single_file_languages;
};

/// @brief Repository totals, structure, distributions and cost estimates.
struct ReportSummary {
  uint64_t total_files = 0;
  uint64_t total_directories = 0;
  uint64_t total_languages = 0;
  double total_loc = 0.0;
  StructureStats structure;
  LanguageSummary languages;
  /// Whole-repository stats (identical to the root's recursive stats).
  DirectoryStats repository;
  std::vector<std::pair<std::string, CocomoEstimate>> cocomo;  ///< Preset table order.

  double testRatio() const;
  double testToCodeRatio() const;  ///< test LOC / source LOC.
};

/// @brief Complete rollup output.
struct RollupReport {
  std::string schema_version = kSchemaVersion;
  std::string strategy;
  std::string loc_metric;
  std::vector<std::string> metric_names;
  std::vector<DirectoryEntry> directories;  ///< Root first, then by path.
  std::vector<FileEntry> files;             ///< Sorted by path.
  ReportSummary summary;
  std::vector<RecordError> errors;          ///< Rejected input records.

  /// @brief True if any input record was rejected (partial result).
  bool hasErrors() const { return !errors.empty(); }

  /// @brief Find a directory entry by path.
  const DirectoryEntry* findDirectory(const std::string& path) const;
};

/// @brief Run the whole engine: tree, rollup, summary, cost estimates.
///
/// Invalid records are reported in RollupReport::errors and excluded;
/// the rest are processed normally.
RollupReport buildReport(const std::vector<FileRecord>& records, const EngineConfig& config);

/// @brief Build a report, prepending errors found before tree construction
///        (e.g. by the JSON reader).
RollupReport buildReport(const std::vector<FileRecord>& records, const EngineConfig& config,
                         const std::vector<RecordError>& prior_errors);

/// @brief Reconstruct input records from a report's file list.
std::vector<FileRecord> recordsFromReport(const RollupReport& report);

/// @brief Derive the per-file entry for a record.
FileEntry makeFileEntry(const FileRecord& record, FileClass classification);

}  // namespace dirstat

#endif  // DIRSTAT_ROLLUP_ROLLUP_REPORT_H

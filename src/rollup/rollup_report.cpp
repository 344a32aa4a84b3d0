// Rollup report: directories, files and repository summary.

#include "rollup/rollup_report.h"

#include <algorithm>

#include "core/path_utils.h"
#include "tree/classifier.h"
#include "tree/tree_builder.h"

namespace dirstat {

namespace {

StructureStats computeStructure(const std::vector<DirectoryEntry>& directories,
                                uint64_t total_files) {
  StructureStats structure;
  if (directories.empty()) return structure;

  double depth_sum = 0.0;
  for (const auto& dir : directories) {
    structure.max_depth = std::max(structure.max_depth, dir.depth);
    depth_sum += dir.depth;
    if (dir.is_leaf) ++structure.leaf_directory_count;
  }
  double dir_count = static_cast<double>(directories.size());
  structure.avg_depth = depth_sum / dir_count;
  structure.avg_files_per_directory = static_cast<double>(total_files) / dir_count;
  return structure;
}

LanguageSummary computeLanguages(const DirectoryStats& repository,
                                 const std::string& loc_metric) {
  LanguageSummary summary;
  double total_loc = repository.total(loc_metric);
  // Share by code size; by file count when no code was measured at all.
  bool by_loc = total_loc > 0.0;

  double best_share = -1.0;
  for (const auto& [language, totals] : repository.by_language) {
    auto loc_iter = totals.totals.find(loc_metric);
    double loc = loc_iter != totals.totals.end() ? loc_iter->second : 0.0;
    summary.by_files[language] = totals.file_count;
    summary.by_loc[language] = loc;
    if (totals.file_count == 1) summary.single_file_languages.push_back(language);

    double share = by_loc ? loc : static_cast<double>(totals.file_count);
    // Strict comparison keeps the alphabetically first language on ties.
    if (share > best_share) {
      best_share = share;
      summary.dominant_language = language;
    }
  }

  if (!repository.by_language.empty()) {
    double denominator = by_loc ? total_loc : static_cast<double>(repository.file_count);
    summary.dominant_language_pct = safeRatio(best_share, denominator);
    summary.polyglot_score = 1.0 - summary.dominant_language_pct;
  }
  return summary;
}

}  // namespace

// ---------------------------------------------------------------------------
// ReportSummary / RollupReport
// ---------------------------------------------------------------------------

double ReportSummary::testRatio() const {
  return safeRatio(static_cast<double>(repository.classes.count(FileClass::Test)),
                   static_cast<double>(repository.file_count));
}

double ReportSummary::testToCodeRatio() const {
  return safeRatio(repository.classes.locOf(FileClass::Test),
                   repository.classes.locOf(FileClass::Source));
}

const DirectoryEntry* RollupReport::findDirectory(const std::string& path) const {
  for (const auto& dir : directories) {
    if (dir.path == path) return &dir;
  }
  return nullptr;
}

// ---------------------------------------------------------------------------
// File entries
// ---------------------------------------------------------------------------

FileEntry makeFileEntry(const FileRecord& record, FileClass classification) {
  FileEntry entry;
  entry.path = record.path;
  entry.filename = path_util::filename(record.path);
  entry.directory = path_util::parentDirectory(record.path);
  entry.language = record.language;
  entry.extension = path_util::extension(record.path);
  entry.metrics = record.metrics;
  entry.flags = record.flags;
  entry.classification = classification;

  double total = record.metricOr0(metric::kLinesTotal);
  double code = record.metricOr0(metric::kLinesCode);
  entry.comment_ratio = safeRatio(record.metricOr0(metric::kLinesComment), total);
  entry.blank_ratio = safeRatio(record.metricOr0(metric::kLinesBlank), total);
  entry.code_ratio = safeRatio(code, total);
  entry.complexity_density = safeRatio(record.metricOr0(metric::kComplexity), code);
  entry.dryness = safeRatio(record.metricOr0(metric::kUloc), code);
  entry.bytes_per_loc = safeRatio(record.metricOr0(metric::kBytes), code);
  return entry;
}

std::vector<FileRecord> recordsFromReport(const RollupReport& report) {
  std::vector<FileRecord> records;
  records.reserve(report.files.size());
  for (const auto& file : report.files) {
    FileRecord record;
    record.path = file.path;
    record.language = file.language;
    record.metrics = file.metrics;
    record.flags = file.flags;
    records.push_back(std::move(record));
  }
  return records;
}

// ---------------------------------------------------------------------------
// buildReport
// ---------------------------------------------------------------------------

RollupReport buildReport(const std::vector<FileRecord>& records, const EngineConfig& config) {
  return buildReport(records, config, {});
}

RollupReport buildReport(const std::vector<FileRecord>& records, const EngineConfig& config,
                         const std::vector<RecordError>& prior_errors) {
  RollupReport report;
  report.errors = prior_errors;

  TreeBuildResult built = buildTree(records);
  report.errors.insert(report.errors.end(), built.errors.begin(), built.errors.end());
  const DirectoryTree& tree = built.tree;

  Classifier classifier(config.classification);
  RollupAggregator aggregator(tree, classifier, config.rollup);

  report.strategy = rollupStrategyToString(config.rollup.strategy);
  report.loc_metric = config.rollup.loc_metric;
  report.metric_names = aggregator.metricNames();
  report.directories = aggregator.aggregate();

  report.files.reserve(tree.records.size());
  for (size_t idx = 0; idx < tree.records.size(); ++idx) {
    report.files.push_back(makeFileEntry(tree.records[idx], aggregator.classes()[idx]));
  }

  ReportSummary& summary = report.summary;
  const DirectoryEntry* root = report.findDirectory(kRootPath);
  if (root) summary.repository = root->recursive;
  summary.total_files = summary.repository.file_count;
  summary.total_directories = report.directories.size();
  summary.total_languages = summary.repository.languageCount();
  summary.total_loc = summary.repository.total(report.loc_metric);
  summary.structure = computeStructure(report.directories, summary.total_files);
  summary.languages = computeLanguages(summary.repository, report.loc_metric);
  summary.cocomo = estimateAll(summary.total_loc / 1000.0, config.presets);
  return report;
}

}  // namespace dirstat

// JSON serialization of rollup reports.

#include "rollup/report_json.h"

#include <string>
#include <string_view>

namespace dirstat {

namespace {

void writeMetricMap(JsonWriter& writer, const MetricMap& metrics) {
  writer.beginObject();
  for (const auto& [name, value] : metrics) {
    writer.key(name);
    writer.value(value);
  }
  writer.endObject();
}

void writeFlags(JsonWriter& writer, const FileFlags& flags) {
  writer.beginObject();
  writer.key("minified");
  writer.value(flags.is_minified);
  writer.key("generated");
  writer.value(flags.is_generated);
  writer.key("binary");
  writer.value(flags.is_binary);
  writer.endObject();
}

void writeClassCounts(JsonWriter& writer, const ClassificationCounts& classes) {
  writer.beginObject();
  for (int idx = 0; idx < kFileClassCount; ++idx) {
    auto cls = static_cast<FileClass>(idx);
    writer.key(fileClassToString(cls));
    writer.value(classes.count(cls));
  }
  writer.endObject();
}

void writeClassLoc(JsonWriter& writer, const ClassificationCounts& classes) {
  writer.beginObject();
  for (int idx = 0; idx < kFileClassCount; ++idx) {
    auto cls = static_cast<FileClass>(idx);
    writer.key(fileClassToString(cls));
    writer.value(classes.locOf(cls));
  }
  writer.endObject();
}

void writeLanguageTotals(JsonWriter& writer,
                         const std::map<std::string, LanguageTotals>& by_language) {
  writer.beginObject();
  for (const auto& [language, totals] : by_language) {
    writer.key(language);
    writer.beginObject();
    writer.key("file_count");
    writer.value(totals.file_count);
    writer.key("totals");
    writeMetricMap(writer, totals.totals);
    writer.endObject();
  }
  writer.endObject();
}

void writeRatios(JsonWriter& writer, const DirectoryStats& stats) {
  writer.key("avg_file_loc");
  writer.value(stats.avgFileLoc());
  writer.key("avg_complexity");
  writer.value(stats.avgComplexity());
  writer.key("comment_ratio");
  writer.value(stats.commentRatio());
  writer.key("blank_ratio");
  writer.value(stats.blankRatio());
  writer.key("dryness");
  writer.value(stats.dryness());
  writer.key("complexity_density");
  writer.value(stats.complexityDensity());
  writer.key("generated_ratio");
  writer.value(stats.generatedRatio());
  writer.key("minified_ratio");
  writer.value(stats.minifiedRatio());
}

void writeDistributions(JsonWriter& writer,
                        const std::map<std::string, MetricDistribution>& distributions) {
  writer.beginObject();
  for (const auto& [name, dist] : distributions) {
    writer.key(name);
    writeDistribution(writer, dist);
  }
  writer.endObject();
}

void writeDirectoryEntry(JsonWriter& writer, const DirectoryEntry& dir) {
  writer.beginObject();
  writer.key("path");
  writer.value(dir.path);
  writer.key("name");
  writer.value(dir.name);
  writer.key("depth");
  writer.value(dir.depth);
  writer.key("is_leaf");
  writer.value(dir.is_leaf);
  writer.key("child_count");
  writer.value(dir.child_count);
  writer.key("subdirectories");
  writer.beginArray();
  for (const auto& child : dir.subdirectories) writer.value(child);
  writer.endArray();
  writer.key("direct");
  writeDirectoryStats(writer, dir.direct);
  writer.key("recursive");
  writeDirectoryStats(writer, dir.recursive);
  writer.endObject();
}

void writeFileEntry(JsonWriter& writer, const FileEntry& file) {
  writer.beginObject();
  writer.key("path");
  writer.value(file.path);
  writer.key("filename");
  writer.value(file.filename);
  writer.key("directory");
  writer.value(file.directory);
  writer.key("language");
  writer.value(file.language);
  writer.key("extension");
  writer.value(file.extension);
  writer.key("classification");
  writer.value(fileClassToString(file.classification));
  writer.key("metrics");
  writeMetricMap(writer, file.metrics);
  writer.key("flags");
  writeFlags(writer, file.flags);
  writer.key("comment_ratio");
  writer.value(file.comment_ratio);
  writer.key("blank_ratio");
  writer.value(file.blank_ratio);
  writer.key("code_ratio");
  writer.value(file.code_ratio);
  writer.key("complexity_density");
  writer.value(file.complexity_density);
  writer.key("dryness");
  writer.value(file.dryness);
  writer.key("bytes_per_loc");
  writer.value(file.bytes_per_loc);
  writer.endObject();
}

void writeCocomo(JsonWriter& writer,
                 const std::vector<std::pair<std::string, CocomoEstimate>>& cocomo) {
  writer.beginObject();
  for (const auto& [name, estimate] : cocomo) {
    writer.key(name);
    writer.beginObject();
    writer.key("effort_person_months");
    writer.value(estimate.effort_person_months);
    writer.key("schedule_months");
    writer.value(estimate.schedule_months);
    writer.key("people");
    writer.value(estimate.people);
    writer.key("cost");
    writer.value(estimate.cost);
    writer.endObject();
  }
  writer.endObject();
}

void writeSummary(JsonWriter& writer, const ReportSummary& summary) {
  const DirectoryStats& repo = summary.repository;

  writer.beginObject();
  writer.key("total_files");
  writer.value(summary.total_files);
  writer.key("total_directories");
  writer.value(summary.total_directories);
  writer.key("total_languages");
  writer.value(summary.total_languages);
  writer.key("total_loc");
  writer.value(summary.total_loc);
  writer.key("metric_totals");
  writeMetricMap(writer, repo.totals);

  writer.key("structure");
  writer.beginObject();
  writer.key("max_depth");
  writer.value(summary.structure.max_depth);
  writer.key("avg_depth");
  writer.value(summary.structure.avg_depth);
  writer.key("leaf_directory_count");
  writer.value(summary.structure.leaf_directory_count);
  writer.key("avg_files_per_directory");
  writer.value(summary.structure.avg_files_per_directory);
  writer.endObject();

  writer.key("ratios");
  writer.beginObject();
  writeRatios(writer, repo);
  writer.key("test_ratio");
  writer.value(summary.testRatio());
  writer.key("test_to_code_ratio");
  writer.value(summary.testToCodeRatio());
  writer.endObject();

  writer.key("file_classifications");
  writeClassCounts(writer, repo.classes);

  // Language mix.
  const LanguageSummary& languages = summary.languages;
  writer.key("languages");
  writer.beginObject();
  writer.key("by_files");
  writer.beginObject();
  for (const auto& [language, count] : languages.by_files) {
    writer.key(language);
    writer.value(count);
  }
  writer.endObject();
  writer.key("by_loc");
  writeMetricMap(writer, languages.by_loc);
  writer.key("dominant_language");
  writer.value(languages.dominant_language);
  writer.key("dominant_language_pct");
  writer.value(languages.dominant_language_pct);
  writer.key("polyglot_score");
  writer.value(languages.polyglot_score);
  writer.key("single_file_languages");
  writer.beginArray();
  for (const auto& language : languages.single_file_languages) writer.value(language);
  writer.endArray();
  writer.endObject();

  writer.key("by_language");
  writeLanguageTotals(writer, repo.by_language);
  writer.key("distributions");
  writeDistributions(writer, repo.distributions);
  writer.key("comment_ratio_distribution");
  writeDistribution(writer, repo.comment_ratio_distribution);
  writer.key("cocomo");
  writeCocomo(writer, summary.cocomo);
  writer.endObject();
}

}  // namespace

// ---------------------------------------------------------------------------
// Public writers
// ---------------------------------------------------------------------------

void writeDistribution(JsonWriter& writer, const MetricDistribution& dist) {
  writer.beginObject();
  writer.key("count");
  writer.value(dist.count);
  writer.key("min");
  writer.value(dist.min);
  writer.key("max");
  writer.value(dist.max);
  writer.key("mean");
  writer.value(dist.mean);
  writer.key("median");
  writer.value(dist.median);
  writer.key("stddev");
  writer.value(dist.stddev);
  writer.key("p25");
  writer.value(dist.p25);
  writer.key("p75");
  writer.value(dist.p75);
  writer.key("p90");
  writer.value(dist.p90);
  writer.key("p95");
  writer.value(dist.p95);
  writer.key("p99");
  writer.value(dist.p99);
  writer.key("skewness");
  writer.value(dist.skewness);
  writer.key("kurtosis");
  writer.value(dist.kurtosis);
  writer.key("cv");
  writer.value(dist.cv);
  writer.key("iqr");
  writer.value(dist.iqr);
  writer.key("gini");
  writer.value(dist.gini);
  writer.key("theil");
  writer.value(dist.theil);
  writer.key("hoover");
  writer.value(dist.hoover);
  writer.key("palma");
  writer.value(dist.palma);  // +inf -> null
  writer.key("top_10_pct_share");
  writer.value(dist.top_10_pct_share);
  writer.key("top_20_pct_share");
  writer.value(dist.top_20_pct_share);
  writer.key("bottom_50_pct_share");
  writer.value(dist.bottom_50_pct_share);
  writer.endObject();
}

void writeDirectoryStats(JsonWriter& writer, const DirectoryStats& stats) {
  writer.beginObject();
  writer.key("file_count");
  writer.value(stats.file_count);
  writer.key("totals");
  writeMetricMap(writer, stats.totals);
  writer.key("language_count");
  writer.value(stats.languageCount());
  writer.key("by_language");
  writeLanguageTotals(writer, stats.by_language);
  writer.key("classifications");
  writeClassCounts(writer, stats.classes);
  writer.key("classification_loc");
  writeClassLoc(writer, stats.classes);
  writer.key("test_loc");
  writer.value(stats.classes.locOf(FileClass::Test));
  writer.key("minified_count");
  writer.value(stats.minified_count);
  writer.key("generated_count");
  writer.value(stats.generated_count);
  writer.key("binary_count");
  writer.value(stats.binary_count);
  writeRatios(writer, stats);
  writer.key("distributions");
  writeDistributions(writer, stats.distributions);
  writer.key("comment_ratio_distribution");
  writeDistribution(writer, stats.comment_ratio_distribution);
  writer.endObject();
}

std::string reportToJson(const RollupReport& report, bool pretty) {
  JsonWriter writer;
  writer.beginObject();

  writer.key("schema_version");
  writer.value(report.schema_version);
  writer.key("strategy");
  writer.value(report.strategy);
  writer.key("loc_metric");
  writer.value(report.loc_metric);
  writer.key("metric_names");
  writer.beginArray();
  for (const auto& name : report.metric_names) writer.value(name);
  writer.endArray();

  writer.key("directories");
  writer.beginArray();
  for (const auto& dir : report.directories) writeDirectoryEntry(writer, dir);
  writer.endArray();

  writer.key("files");
  writer.beginArray();
  for (const auto& file : report.files) writeFileEntry(writer, file);
  writer.endArray();

  writer.key("summary");
  writeSummary(writer, report.summary);

  writer.key("errors");
  writer.beginArray();
  for (const auto& error : report.errors) {
    writer.beginObject();
    writer.key("path");
    writer.value(error.path);
    writer.key("kind");
    writer.value(recordErrorKindToString(error.kind));
    writer.key("reason");
    writer.value(error.reason);
    writer.endObject();
  }
  writer.endArray();

  writer.endObject();
  return pretty ? writer.toPrettyString() : writer.toString();
}

}  // namespace dirstat

/// @file
/// @brief CLI entry point for the dirstat rollup engine.

#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include "config/engine_config.h"
#include "core/basic_types.h"
#include "io/record_reader.h"
#include "rollup/report_json.h"
#include "rollup/rollup_report.h"
#include "validate/report_validator.h"

namespace {

/// Process exit codes.
constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitPartial = 2;  ///< Report written, some records rejected.
constexpr int kExitViolations = 3;  ///< --strict and the validator failed.

/// @brief Command-line options parsed from argv.
struct CliOptions {
  std::string input = "-";
  std::string output;  ///< Empty = stdout.
  std::string config_path;
  std::string strategy;
  std::vector<std::string> metrics;
  bool validate = false;
  bool strict = false;
  bool compact = false;
  bool verbose = false;
};

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("dirstat_cli - Directory tree metrics rollup\n\n");
  std::printf("Usage: dirstat_cli [options]\n\n");
  std::printf("Options:\n");
  std::printf("  --input FILE     Input records JSON ('-' = stdin, default)\n");
  std::printf("  -o FILE          Output report path (default: stdout)\n");
  std::printf("  --config FILE    Engine configuration JSON\n");
  std::printf("  --strategy S     Rollup strategy: bottom_up, ancestor_closure\n");
  std::printf("  --metric NAME    Track a metric (repeatable; default: all)\n");
  std::printf("  --validate       Run consistency checks on the report\n");
  std::printf("  --strict         Exit with code 3 when a check fails (implies --validate)\n");
  std::printf("  --compact        Single-line JSON output\n");
  std::printf("  --verbose        Log rejected records and violations\n");
  std::printf("  --help           Show this help\n");
  std::printf("\nExit codes:\n");
  std::printf("  0 ok, 1 failure, 2 some records rejected, 3 validation failed (--strict)\n");
}

/// @brief Parse command-line arguments into CliOptions.
/// @return False if --help was requested (caller should exit cleanly).
bool parseArgs(int argc, char* argv[], CliOptions& opts) {
  for (int idx = 1; idx < argc; ++idx) {
    if (std::strcmp(argv[idx], "--help") == 0 ||
        std::strcmp(argv[idx], "-h") == 0) {
      printUsage();
      return false;
    }
    if (std::strcmp(argv[idx], "--input") == 0 && idx + 1 < argc) {
      opts.input = argv[++idx];
    } else if (std::strcmp(argv[idx], "-o") == 0 && idx + 1 < argc) {
      opts.output = argv[++idx];
    } else if (std::strcmp(argv[idx], "--config") == 0 && idx + 1 < argc) {
      opts.config_path = argv[++idx];
    } else if (std::strcmp(argv[idx], "--strategy") == 0 && idx + 1 < argc) {
      opts.strategy = argv[++idx];
    } else if (std::strcmp(argv[idx], "--metric") == 0 && idx + 1 < argc) {
      opts.metrics.push_back(argv[++idx]);
    } else if (std::strcmp(argv[idx], "--validate") == 0) {
      opts.validate = true;
    } else if (std::strcmp(argv[idx], "--strict") == 0) {
      opts.strict = true;
      opts.validate = true;
    } else if (std::strcmp(argv[idx], "--compact") == 0) {
      opts.compact = true;
    } else if (std::strcmp(argv[idx], "--verbose") == 0) {
      opts.verbose = true;
    } else {
      std::fprintf(stderr, "Warning: ignoring unknown argument '%s'\n", argv[idx]);
    }
  }
  return true;
}

/// @brief Read a whole file, or stdin for "-".
bool readText(const std::string& path, std::string& out) {
  if (path == "-") {
    out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return !std::cin.bad();
  }
  std::ifstream file(path, std::ios::binary);
  if (!file) return false;
  std::ostringstream buffer;
  buffer << file.rdbuf();
  out = buffer.str();
  return true;
}

bool writeText(const std::string& path, const std::string& text) {
  std::ofstream file(path, std::ios::binary);
  if (!file) return false;
  file << text;
  return static_cast<bool>(file);
}

/// @brief Assemble the engine configuration: defaults, config file, then flags.
bool buildEngineConfig(const CliOptions& opts, dirstat::EngineConfig& config) {
  if (!opts.config_path.empty()) {
    std::string text;
    if (!readText(opts.config_path, text)) {
      std::fprintf(stderr, "Error: failed to read %s\n", opts.config_path.c_str());
      return false;
    }
    std::string error;
    if (!dirstat::loadConfigFromJson(text, config, &error)) {
      std::fprintf(stderr, "Error: %s: %s\n", opts.config_path.c_str(), error.c_str());
      return false;
    }
  }

  if (!opts.strategy.empty() &&
      !dirstat::rollupStrategyFromString(opts.strategy, config.rollup.strategy)) {
    std::fprintf(stderr, "Error: unknown strategy '%s'\n", opts.strategy.c_str());
    return false;
  }
  if (!opts.metrics.empty()) config.rollup.tracked_metrics = opts.metrics;

  std::string error;
  if (!dirstat::validateEngineConfig(config, &error)) {
    std::fprintf(stderr, "Error: invalid configuration: %s\n", error.c_str());
    return false;
  }
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  if (!parseArgs(argc, argv, opts)) return kExitOk;

  dirstat::EngineConfig config;
  if (!buildEngineConfig(opts, config)) return kExitFailure;

  std::string input_text;
  if (!readText(opts.input, input_text)) {
    std::fprintf(stderr, "Error: failed to read %s\n", opts.input.c_str());
    return kExitFailure;
  }
  dirstat::RecordReadResult input = dirstat::readRecordsFromJson(input_text);
  if (!input.success) {
    std::fprintf(stderr, "Error: %s\n", input.error_message.c_str());
    return kExitFailure;
  }

  dirstat::RollupReport report = dirstat::buildReport(input.records, config, input.errors);
  std::string json = dirstat::reportToJson(report, !opts.compact);

  // Progress goes to stdout only when stdout is not carrying the report.
  bool to_stdout = opts.output.empty();
  if (to_stdout) {
    std::fwrite(json.data(), 1, json.size(), stdout);
    std::fputc('\n', stdout);
  } else {
    if (!writeText(opts.output, json)) {
      std::fprintf(stderr, "Error: failed to write %s\n", opts.output.c_str());
      return kExitFailure;
    }
    std::printf("dirstat_cli v0.1.0\n");
    std::printf("Strategy:    %s\n", report.strategy.c_str());
    std::printf("Files:       %llu\n",
                static_cast<unsigned long long>(report.summary.total_files));
    std::printf("Directories: %llu\n",
                static_cast<unsigned long long>(report.summary.total_directories));
    std::printf("LOC:         %.0f (%s)\n", report.summary.total_loc, report.loc_metric.c_str());
    std::printf("Output:      %s\n", opts.output.c_str());
  }

  if (report.hasErrors()) {
    std::fprintf(stderr, "Warning: %zu record(s) rejected\n", report.errors.size());
    if (opts.verbose) {
      for (const auto& error : report.errors) {
        std::fprintf(stderr, "  [%s] %s: %s\n", dirstat::recordErrorKindToString(error.kind),
                     error.path.c_str(), error.reason.c_str());
      }
    }
  }

  if (opts.validate) {
    dirstat::ValidationReport validation = dirstat::validateReport(report, config.presets);
    if (!to_stdout) {
      std::string json_path = opts.output + ".validation.json";
      if (writeText(json_path, validation.toJson())) {
        std::printf("Validation:  %s\n", json_path.c_str());
      } else {
        std::fprintf(stderr, "Warning: failed to write %s\n", json_path.c_str());
      }
    }
    if (!validation.passed()) {
      std::fprintf(stderr, "Warning: %zu validation violation(s)\n",
                   validation.violations.size());
      if (opts.verbose) {
        for (const auto& violation : validation.violations) {
          std::fprintf(stderr, "  [%s] %s %s: %s (expected %g, actual %g)\n",
                       violation.check_id.c_str(), violation.path.c_str(),
                       violation.metric.c_str(), violation.message.c_str(),
                       violation.expected, violation.actual);
        }
      }
      if (opts.strict) return kExitViolations;
    }
  }

  return report.hasErrors() ? kExitPartial : kExitOk;
}

// JSON input reader for file records.

#ifndef DIRSTAT_IO_RECORD_READER_H
#define DIRSTAT_IO_RECORD_READER_H

#include <string>
#include <string_view>
#include <vector>

#include "core/basic_types.h"
#include "core/json_parser.h"

namespace dirstat {

/// @brief Records read from an input document.
struct RecordReadResult {
  bool success = false;           ///< False only when the document itself is unusable.
  std::string error_message;      ///< Set when success is false.
  std::vector<FileRecord> records;
  std::vector<RecordError> errors;  ///< Records rejected while reading.
};

/// @brief Convert one JSON record object.
///
/// Accepts flags either nested ("flags": {"minified", "generated",
/// "binary"}) or flat ("is_minified", "is_generated", "is_binary").
/// @return False with `error` filled when the record must be rejected.
bool recordFromJson(const JsonValue& obj, FileRecord& record, RecordError& error);

/// @brief Read records from a parsed document.
///
/// The document is either an array of records or an object with a "files"
/// array. Bad records are collected in `errors` and skipped.
RecordReadResult readRecords(const JsonValue& document);

/// @brief Parse JSON text and read records from it.
RecordReadResult readRecordsFromJson(std::string_view text);

}  // namespace dirstat

#endif  // DIRSTAT_IO_RECORD_READER_H

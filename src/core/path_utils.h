// Repository-relative path helpers.

#ifndef DIRSTAT_CORE_PATH_UTILS_H
#define DIRSTAT_CORE_PATH_UTILS_H

#include <string>
#include <string_view>
#include <vector>

namespace dirstat {
namespace path_util {

/// @brief Check that a path is repository-relative and normalized.
///
/// Rejects empty paths, a leading '/', a trailing '/', backslash
/// separators, and empty, "." or ".." segments.
///
/// @param path Path to check.
/// @param reason Receives a human-readable reason on failure (may be null).
/// @return True if the path is acceptable.
bool isValidRelativePath(std::string_view path, std::string* reason);

/// @brief Directory containing a file path.
/// @return Text before the last '/', or "/" for files at the root.
std::string parentDirectory(std::string_view path);

/// @brief Final path component.
std::string filename(std::string_view path);

/// @brief Extension of the final component including the dot.
///
/// Dot-files such as ".gitignore" have no extension.
/// @return ".py" for "a/b.py", "" when absent.
std::string extension(std::string_view path);

/// @brief Split a directory path into its components ("/" -> {}).
std::vector<std::string> splitSegments(std::string_view path);

/// @brief Depth of a directory path ("/" -> 0, "src" -> 1, "src/lib" -> 2).
int directoryDepth(std::string_view dir_path);

/// @brief All ancestor directories of a directory, nearest first, ending at "/".
///
/// "src/lib" -> {"src", "/"}. The root has no ancestors.
std::vector<std::string> ancestors(std::string_view dir_path);

/// @brief Ordering used for directory listings: root first, then lexicographic.
bool directoryLess(const std::string& lhs, const std::string& rhs);

/// @brief Lowercase ASCII copy of a string.
std::string toLower(std::string_view text);

}  // namespace path_util
}  // namespace dirstat

#endif  // DIRSTAT_CORE_PATH_UTILS_H

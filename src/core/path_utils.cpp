// Repository-relative path helpers.

#include "core/path_utils.h"

#include <cctype>

#include "core/basic_types.h"

namespace dirstat {
namespace path_util {

bool isValidRelativePath(std::string_view path, std::string* reason) {
  auto fail = [reason](const char* why) {
    if (reason) *reason = why;
    return false;
  };

  if (path.empty()) return fail("empty path");
  if (path.front() == '/') return fail("absolute path");
  if (path.back() == '/') return fail("trailing separator");
  if (path.find('\\') != std::string_view::npos) {
    return fail("backslash separator");
  }

  size_t start = 0;
  while (start <= path.size()) {
    size_t end = path.find('/', start);
    if (end == std::string_view::npos) end = path.size();
    std::string_view segment = path.substr(start, end - start);
    if (segment.empty()) return fail("empty path segment");
    if (segment == "..") return fail("parent directory segment");
    if (segment == ".") return fail("current directory segment");
    start = end + 1;
  }
  return true;
}

std::string parentDirectory(std::string_view path) {
  size_t slash = path.rfind('/');
  if (slash == std::string_view::npos || slash == 0) return kRootPath;
  return std::string(path.substr(0, slash));
}

std::string filename(std::string_view path) {
  size_t slash = path.rfind('/');
  if (slash == std::string_view::npos) return std::string(path);
  return std::string(path.substr(slash + 1));
}

std::string extension(std::string_view path) {
  std::string name = filename(path);
  size_t dot = name.rfind('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 == name.size()) {
    return "";
  }
  return name.substr(dot);
}

std::vector<std::string> splitSegments(std::string_view path) {
  std::vector<std::string> result;
  if (path.empty() || path == kRootPath) return result;

  size_t start = 0;
  while (start <= path.size()) {
    size_t end = path.find('/', start);
    if (end == std::string_view::npos) end = path.size();
    if (end > start) {
      result.emplace_back(path.substr(start, end - start));
    }
    start = end + 1;
  }
  return result;
}

int directoryDepth(std::string_view dir_path) {
  return static_cast<int>(splitSegments(dir_path).size());
}

std::vector<std::string> ancestors(std::string_view dir_path) {
  std::vector<std::string> result;
  if (dir_path == kRootPath) return result;

  std::string current(dir_path);
  while (current != kRootPath) {
    current = parentDirectory(current);
    result.push_back(current);
  }
  return result;
}

bool directoryLess(const std::string& lhs, const std::string& rhs) {
  bool lhs_root = lhs == kRootPath;
  bool rhs_root = rhs == kRootPath;
  if (lhs_root != rhs_root) return lhs_root;
  return lhs < rhs;
}

std::string toLower(std::string_view text) {
  std::string result(text);
  for (char& chr : result) {
    chr = static_cast<char>(std::tolower(static_cast<unsigned char>(chr)));
  }
  return result;
}

}  // namespace path_util
}  // namespace dirstat

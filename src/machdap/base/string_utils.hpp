#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace machdap::util {

inline std::string to_lower(std::string_view value) {
  std::string out(value.begin(), value.end());
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return out;
}

inline std::string_view trim_view(std::string_view value) {
  size_t first = value.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return std::string_view{};
  }
  size_t last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

inline std::string trim_copy(std::string_view value) {
  std::string_view trimmed = trim_view(value);
  return std::string(trimmed.begin(), trimmed.end());
}

inline std::vector<std::string_view> split_view(std::string_view value, char separator) {
  std::vector<std::string_view> parts;
  size_t start = 0;
  while (start <= value.size()) {
    size_t end = value.find(separator, start);
    if (end == std::string_view::npos) {
      parts.push_back(value.substr(start));
      break;
    }
    parts.push_back(value.substr(start, end - start));
    start = end + 1;
  }
  return parts;
}

// last path component, accepting both separators
inline std::string_view basename_view(std::string_view path) {
  size_t slash = path.find_last_of("/\\");
  if (slash == std::string_view::npos) {
    return path;
  }
  return path.substr(slash + 1);
}

// true when `path` ends with `suffix` on a component boundary
inline bool path_has_suffix(std::string_view path, std::string_view suffix) {
  if (suffix.empty() || suffix.size() > path.size()) {
    return false;
  }
  if (path.substr(path.size() - suffix.size()) != suffix) {
    return false;
  }
  if (suffix.size() == path.size()) {
    return true;
  }
  char before = path[path.size() - suffix.size() - 1];
  return before == '/' || before == '\\' || suffix.front() == '/';
}

} // namespace machdap::util

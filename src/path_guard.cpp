/**
 * @file path_guard.cpp
 * @brief Lexical path containment checks
 */

#include "vconv/path_guard.hpp"

#include <fmt/core.h>

namespace vconv {

bool has_parent_segment(const std::string &path) {
  size_t pos = 0;
  while (pos <= path.size()) {
    size_t end = path.find('/', pos);
    if (end == std::string::npos)
      end = path.size();
    if (end - pos == 2 && path.compare(pos, 2, "..") == 0)
      return true;
    pos = end + 1;
  }
  return false;
}

std::string collapse_path(const std::string &path) {
  std::string out;
  out.reserve(path.size());
  size_t pos = 0;
  const bool absolute = !path.empty() && path.front() == '/';
  while (pos <= path.size()) {
    size_t end = path.find('/', pos);
    if (end == std::string::npos)
      end = path.size();
    const std::string seg = path.substr(pos, end - pos);
    if (!seg.empty() && seg != ".") {
      if (!out.empty() || absolute)
        out += '/';
      out += seg;
    }
    pos = end + 1;
  }
  if (out.empty())
    return absolute ? "/" : ".";
  return out;
}

bool path_within_root(const std::string &path, const std::string &root) {
  const std::string p = collapse_path(path);
  const std::string r = collapse_path(root);
  if (r == "/")
    return !p.empty() && p.front() == '/';
  if (p.size() < r.size() || p.compare(0, r.size(), r) != 0)
    return false;
  return p.size() == r.size() || p[r.size()] == '/';
}

bool path_within_roots(const std::string &path,
                       const std::vector<std::string> &roots) {
  for (const auto &root : roots) {
    if (path_within_root(path, root))
      return true;
  }
  return false;
}

bool check_remote_path(const std::string &path,
                       const std::vector<std::string> &roots,
                       std::string &err) {
  if (path.empty() || path.front() != '/') {
    err = fmt::format("remote path is not absolute: '{}'", path);
    return false;
  }
  if (has_parent_segment(path)) {
    err = fmt::format("remote path contains '..': '{}'", path);
    return false;
  }
  if (!path_within_roots(path, roots)) {
    err = fmt::format("remote path outside configured roots: '{}'", path);
    return false;
  }
  return true;
}

std::string parent_path(const std::string &path) {
  const std::string p = collapse_path(path);
  const size_t slash = p.find_last_of('/');
  if (slash == std::string::npos)
    return ".";
  if (slash == 0)
    return "/";
  return p.substr(0, slash);
}

std::string join_path(const std::string &dir, const std::string &name) {
  if (dir.empty())
    return name;
  if (dir.back() == '/')
    return dir + name;
  return dir + "/" + name;
}

} // namespace vconv

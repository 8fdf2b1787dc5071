/**
 * @file scanner.cpp
 * @brief Root walking and candidate filtering
 */

#include "vconv/scanner.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <utility>

#include <fnmatch.h>

#include "vconv/fingerprint.hpp"
#include "vconv/logging.hpp"
#include "vconv/path_guard.hpp"

namespace vconv {

namespace {

bool ends_with(const std::string &s, const std::string &suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // anonymous namespace

std::string file_extension(const std::string &name) {
  const size_t dot = name.find_last_of('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 == name.size())
    return "";
  std::string ext = name.substr(dot + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext;
}

Scanner::Scanner(TransferBackend &backend, ScanFilter filter)
    : backend_(backend), filter_(std::move(filter)) {}

bool Scanner::accepts(const std::string &name, const std::string &path,
                      std::string *extension) const {
  if (name.empty() || name.front() == '.')
    return false;
  if (ends_with(name, PARTIAL_SUFFIX))
    return false;

  const std::string ext = file_extension(name);
  if (std::find(filter_.include_extensions.begin(),
                filter_.include_extensions.end(),
                ext) == filter_.include_extensions.end())
    return false;

  for (const auto &pattern : filter_.exclude_patterns) {
    if (::fnmatch(pattern.c_str(), path.c_str(), 0) == 0) {
      LOG_DEBUG("Excluded by '{}': {}", pattern, path);
      return false;
    }
  }

  if (extension)
    *extension = ext;
  return true;
}

ScanStats Scanner::scan(const Sink &sink) {
  ScanStats stats;
  for (const auto &root : filter_.roots) {
    if (!scan_root(canonical_path(root), sink, stats))
      break;
  }
  return stats;
}

std::vector<Candidate> Scanner::collect(ScanStats *stats) {
  std::vector<Candidate> out;
  ScanStats s = scan([&out](const Candidate &c) {
    out.push_back(c);
    return true;
  });
  if (stats)
    *stats = s;
  return out;
}

bool Scanner::scan_root(const std::string &root, const Sink &sink,
                        ScanStats &stats) {
  std::string err;
  std::string resolved_root;
  if (!backend_.realpath(root, resolved_root, err)) {
    ++stats.roots_failed;
    LOG_ERROR("DiscoveryError: skipping root {}: {}", root, err);
    return true;
  }

  std::vector<FileEntry> entries;
  if (!backend_.list(root, entries, err)) {
    ++stats.roots_failed;
    LOG_ERROR("DiscoveryError: skipping root {}: {}", root, err);
    return true;
  }
  ++stats.roots_scanned;

  std::set<std::string> visited{resolved_root};
  std::vector<std::pair<std::string, std::vector<FileEntry>>> pending;
  pending.emplace_back(root, std::move(entries));

  while (!pending.empty()) {
    std::string dir = std::move(pending.back().first);
    std::vector<FileEntry> listing = std::move(pending.back().second);
    pending.pop_back();
    ++stats.directories;

    /// Deterministic order within a directory
    std::sort(listing.begin(), listing.end(),
              [](const FileEntry &a, const FileEntry &b) {
                return a.name < b.name;
              });

    for (auto &entry : listing) {
      if (entry.name.empty() || entry.name.front() == '.')
        continue;
      const std::string path = join_path(dir, entry.name);

      std::string real = path;
      const bool via_link = entry.is_symlink;
      if (via_link) {
        std::string target_err;
        if (!backend_.realpath(path, real, target_err)) {
          LOG_DEBUG("Dangling symlink {}: {}", path, target_err);
          continue;
        }
        if (!path_within_root(real, resolved_root)) {
          ++stats.symlinks_rejected;
          LOG_EVENT(LogEvent::Skipped, "{} (symlink resolves outside {})", path,
                    root);
          continue;
        }
        FileEntry target;
        if (!backend_.stat(path, target, target_err)) {
          LOG_DEBUG("Cannot stat symlink target {}: {}", path, target_err);
          continue;
        }
        target.name = entry.name;
        entry = target;
      }

      if (entry.is_dir) {
        if (!via_link) {
          /// Plain directory: its real path is below the resolved root
          real = collapse_path(resolved_root + path.substr(root.size()));
        }
        if (!visited.insert(real).second)
          continue; //< Already walked through another link
        std::vector<FileEntry> sub;
        std::string list_err;
        if (!backend_.list(path, sub, list_err)) {
          LOG_WARN("Cannot list {}: {}", path, list_err);
          continue;
        }
        pending.emplace_back(path, std::move(sub));
        continue;
      }

      if (!entry.is_regular)
        continue;

      std::string ext;
      if (!accepts(entry.name, path, &ext)) {
        ++stats.ignored;
        continue;
      }

      Candidate c;
      c.path = canonical_path(path);
      c.root = root;
      c.size = entry.size;
      c.mtime = entry.mtime;
      c.extension = ext;
      ++stats.candidates;
      if (!sink(c))
        return false;
    }
  }
  return true;
}

} // namespace vconv

/**
 * @file scanner.hpp
 * @brief Discovery of candidate files under the configured roots
 *
 * @details The Scanner walks each root through a TransferBackend and yields
 *          Candidates to a sink, one at a time, so a cycle can stop early.
 *
 *          - Hidden entries and in-progress outputs are never yielded
 *
 *          - Extensions match case-insensitively against the include set
 *
 *          - Exclude globs (fnmatch) are tried against the full path only;
 *            the first match excludes
 *
 *          - A symlink is followed only if it resolves inside the root being
 *            walked; directory cycles are broken by a visited set
 *
 *          - A root that cannot be listed is skipped (DiscoveryError) and the
 *            remaining roots are still walked
 */

#ifndef VCONV_SCANNER_HPP
#define VCONV_SCANNER_HPP

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "transfer_backend.hpp"
#include "types.hpp"

namespace vconv {

/**
 * @struct ScanFilter
 * @brief Include/exclude rules for one scan.
 */
struct ScanFilter {
  std::vector<std::string> roots;
  std::vector<std::string> include_extensions; //< Lowercase, no dot
  std::vector<std::string> exclude_patterns;
};

/**
 * @struct ScanStats
 * @brief Counters for one pass over the roots.
 */
struct ScanStats {
  size_t roots_scanned = 0;
  size_t roots_failed = 0;
  size_t directories = 0;
  size_t candidates = 0;
  size_t ignored = 0; //< Regular files rejected by the filters
  size_t symlinks_rejected = 0;
};

class Scanner {
public:
  /// Return false from the sink to stop the walk
  using Sink = std::function<bool(const Candidate &)>;

  Scanner(TransferBackend &backend, ScanFilter filter);

  /**
   * @brief Walk every root, feeding candidates to sink.
   * @note Restartable: each call starts a fresh walk.
   */
  ScanStats scan(const Sink &sink);

  /// Convenience: gather every candidate into a vector
  std::vector<Candidate> collect(ScanStats *stats = nullptr);

  /// true if a file name passes the extension and exclude rules
  bool accepts(const std::string &name, const std::string &path,
               std::string *extension = nullptr) const;

private:
  TransferBackend &backend_;
  ScanFilter filter_;

  /// @return false if the sink asked to stop
  bool scan_root(const std::string &root, const Sink &sink, ScanStats &stats);
};

/// Lowercase extension without the dot ("" if none)
std::string file_extension(const std::string &name);

} // namespace vconv

#endif // VCONV_SCANNER_HPP

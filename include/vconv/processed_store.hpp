/**
 * @file processed_store.hpp
 * @brief Durable set of committed fingerprints
 *
 * @details The store is a JSON array of 64-char lowercase hex strings kept at
 *          `<state_dir>/processed.json`. External tools read and rewrite the
 *          same file, so its flat shape is part of the daemon's contract.
 *
 *          - Loaded once at startup
 *
 *          - Rewritten whole after every successful commit (temp + fsync +
 *            rename), so the file is never observable half written
 *
 *          - Scan cycles filter against an immutable snapshot
 */

#ifndef VCONV_PROCESSED_STORE_HPP
#define VCONV_PROCESSED_STORE_HPP

#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace vconv {

/// File name of the state file inside the state directory
constexpr const char *STATE_FILE_NAME = "processed.json";

/**
 * @class ProcessedStore
 * @brief Thread-safe owner of the ProcessedSet.
 *
 * @attention CONCURRENCY:
 *
 *   - record() and reset() are serialized by an internal mutex
 *
 *   - The in-memory set is copy-on-write: a snapshot taken before a commit
 *     never changes, and the new set only becomes visible once persisted
 */
class ProcessedStore {
public:
  using Set = std::set<std::string>;
  using Snapshot = std::shared_ptr<const Set>;

  explicit ProcessedStore(const std::string &state_dir);

  /**
   * @brief Load the state file.
   *
   * @details A missing file yields an empty set. A file that does not parse
   *          as a JSON array is moved aside to `processed.json.corrupt` and
   *          the set starts empty. Invalid entries are dropped.
   *
   * @param move_corrupt false leaves a corrupt file in place (dry-run)
   * @return Number of fingerprints loaded
   */
  size_t load(bool move_corrupt = true);

  /// Point-in-time view of the committed set
  Snapshot snapshot() const;

  bool contains(const std::string &fingerprint) const;
  size_t size() const;

  /**
   * @brief Merge one fingerprint and persist the whole set atomically.
   * @return false with err set if the state file could not be written; the
   *         in-memory set is then left unchanged
   */
  bool record(const std::string &fingerprint, std::string &err);

  /// Atomically rewrite the state file to an empty array
  bool reset(std::string &err);

  const std::string &path() const { return path_; }

private:
  std::string path_;
  mutable std::mutex mutex_; //< Serializes writers and guards set_
  Snapshot set_;

  bool persist(const Set &set, std::string &err) const;
};

} // namespace vconv

#endif // VCONV_PROCESSED_STORE_HPP

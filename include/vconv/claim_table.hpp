/**
 * @file claim_table.hpp
 * @brief In-memory set of fingerprints currently in flight
 */

#ifndef VCONV_CLAIM_TABLE_HPP
#define VCONV_CLAIM_TABLE_HPP

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_set>
#include <utility>

namespace vconv {

/**
 * @class ClaimTable
 * @brief At most one active Job per fingerprint, across overlapping cycles.
 * @note Lives for the scheduler's process lifetime only; never persisted.
 */
class ClaimTable {
public:
  /**
   * @brief Claim a fingerprint.
   * @return false if it is already claimed
   */
  bool try_claim(const std::string &fingerprint);

  /// Release a claim (no-op if not held)
  void release(const std::string &fingerprint);

  bool contains(const std::string &fingerprint) const;
  size_t size() const;

private:
  mutable std::mutex mutex_;
  std::unordered_set<std::string> claimed_;
};

/**
 * @class ClaimGuard
 * @brief Releases a held claim when the owning Job goes out of scope.
 */
class ClaimGuard {
public:
  ClaimGuard(ClaimTable &table, std::string fingerprint)
      : table_(table), fingerprint_(std::move(fingerprint)) {}
  ~ClaimGuard() { table_.release(fingerprint_); }

  ClaimGuard(const ClaimGuard &) = delete;
  ClaimGuard &operator=(const ClaimGuard &) = delete;

private:
  ClaimTable &table_;
  std::string fingerprint_;
};

} // namespace vconv

#endif // VCONV_CLAIM_TABLE_HPP

/**
 * @file claim_table.cpp
 * @brief ClaimTable implementation
 */

#include "vconv/claim_table.hpp"

namespace vconv {

bool ClaimTable::try_claim(const std::string &fingerprint) {
  std::lock_guard<std::mutex> lock(mutex_);
  return claimed_.insert(fingerprint).second;
}

void ClaimTable::release(const std::string &fingerprint) {
  std::lock_guard<std::mutex> lock(mutex_);
  claimed_.erase(fingerprint);
}

bool ClaimTable::contains(const std::string &fingerprint) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return claimed_.count(fingerprint) > 0;
}

size_t ClaimTable::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return claimed_.size();
}

} // namespace vconv

/**
 * @file processed_store.cpp
 * @brief ProcessedStore implementation (nlohmann_json state file)
 */

#include "vconv/processed_store.hpp"

#include <cerrno>
#include <cstdio>
#include <fstream>

#include <nlohmann/json.hpp>

#include "vconv/fingerprint.hpp"
#include "vconv/logging.hpp"
#include "vconv/system.hpp"

namespace vconv {

using json = nlohmann::json;

ProcessedStore::ProcessedStore(const std::string &state_dir)
    : path_(state_dir + "/" + STATE_FILE_NAME),
      set_(std::make_shared<const Set>()) {}

size_t ProcessedStore::load(bool move_corrupt) {
  auto loaded = std::make_shared<Set>();

  std::ifstream in(path_);
  if (!in) {
    LOG_INFO("State file {} not found, starting empty", path_);
    std::lock_guard<std::mutex> lock(mutex_);
    set_ = loaded;
    return 0;
  }

  json root;
  bool corrupt = false;
  try {
    in >> root;
    corrupt = !root.is_array();
  } catch (const json::exception &e) {
    LOG_WARN("State file {} does not parse: {}", path_, e.what());
    corrupt = true;
  }
  in.close();

  if (corrupt && !move_corrupt) {
    LOG_WARN("State file {} is corrupt, treating it as empty", path_);
  } else if (corrupt) {
    const std::string aside = path_ + ".corrupt";
    if (std::rename(path_.c_str(), aside.c_str()) == 0) {
      LOG_WARN("State file is not a JSON array, moved to {}", aside);
    } else {
      LOG_ERROR("State file is corrupt and could not be moved to {}: {}", aside,
                errno_string(errno));
    }
  } else {
    size_t dropped = 0;
    for (const auto &entry : root) {
      if (entry.is_string() && is_valid_fingerprint(entry.get<std::string>())) {
        loaded->insert(entry.get<std::string>());
      } else {
        ++dropped;
      }
    }
    if (dropped > 0)
      LOG_WARN("Dropped {} invalid entries from {}", dropped, path_);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  set_ = loaded;
  LOG_INFO("Loaded {} processed fingerprints from {}", set_->size(), path_);
  return set_->size();
}

ProcessedStore::Snapshot ProcessedStore::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return set_;
}

bool ProcessedStore::contains(const std::string &fingerprint) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return set_->count(fingerprint) > 0;
}

size_t ProcessedStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return set_->size();
}

bool ProcessedStore::record(const std::string &fingerprint, std::string &err) {
  if (!is_valid_fingerprint(fingerprint)) {
    err = "refusing to record malformed fingerprint '" + fingerprint + "'";
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (set_->count(fingerprint))
    return true;

  auto next = std::make_shared<Set>(*set_);
  next->insert(fingerprint);
  if (!persist(*next, err))
    return false;
  set_ = next;
  return true;
}

bool ProcessedStore::reset(std::string &err) {
  std::lock_guard<std::mutex> lock(mutex_);
  Set empty;
  if (!persist(empty, err))
    return false;
  set_ = std::make_shared<const Set>();
  return true;
}

bool ProcessedStore::persist(const Set &set, std::string &err) const {
  /// std::set iterates sorted, so the file is stable across rewrites
  json arr = json::array();
  for (const auto &fp : set)
    arr.push_back(fp);
  return write_file_atomic(path_, arr.dump(2) + "\n", err);
}

} // namespace vconv

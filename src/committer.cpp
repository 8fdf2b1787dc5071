/**
 * @file committer.cpp
 * @brief Finalize, record, then optionally delete the source
 */

#include "vconv/committer.hpp"

#include <ctime>

#include <fmt/core.h>

#include "vconv/logging.hpp"

namespace vconv {

std::string output_path_for(const std::string &source,
                            const std::string &output_extension) {
  const size_t slash = source.find_last_of('/');
  const size_t dot = source.find_last_of('.');
  const bool has_ext =
      dot != std::string::npos &&
      (slash == std::string::npos || dot > slash + 1);
  const std::string stem = has_ext ? source.substr(0, dot) : source;
  return stem + "." + output_extension;
}

Committer::Committer(TransferBackend &backend, ProcessedStore &store,
                     const Settings &settings)
    : backend_(backend), store_(store), settings_(settings) {}

void Committer::discard_partial(const std::string &partial) {
  std::string err;
  FileEntry info;
  if (!backend_.stat(partial, info, err))
    return; //< Nothing left behind
  if (!backend_.remove(partial, err))
    LOG_WARN("Could not remove partial output {}: {}", partial, err);
}

JobResult Committer::commit(Job &job, const AbortCheck &should_abort) {
  JobResult result;
  result.outcome = JobOutcome::Failed;
  std::string err;

  TIMER_START(commit);

  // **---- 1. Finalize ----**

  const std::string partial = job.destination + PARTIAL_SUFFIX;
  if (!backend_.put(job.staged_output, partial, should_abort, err)) {
    discard_partial(partial);
    if (should_abort && should_abort()) {
      result.outcome = JobOutcome::Abandoned;
      result.message = "upload cancelled for shutdown";
      return result;
    }
    result.error = ErrorKind::Transfer;
    result.message = "upload failed: " + err;
    return result;
  }
  if (!backend_.rename(partial, job.destination, err)) {
    discard_partial(partial);
    result.error = ErrorKind::Commit;
    result.message = "finalize failed: " + err;
    return result;
  }

  // **---- 2. Timestamp ----**

  const std::int64_t mtime = settings_.mtime_policy == MtimePolicy::Source
                                 ? job.candidate.mtime
                                 : static_cast<std::int64_t>(std::time(nullptr));
  if (!backend_.set_mtime(job.destination, mtime, err)) {
    LOG_WARN("Could not set mtime on {}: {}", job.destination, err);
  }

  // **---- 3. Record ----**

  if (!store_.record(job.fingerprint, err)) {
    /// Output is visible, fingerprint is not durable: keep the source
    result.error = ErrorKind::Commit;
    result.message = fmt::format(
        "output finalized at {} but state persist failed: {}", job.destination,
        err);
    return result;
  }

  // **---- 4. Source ----**

  if (!settings_.keep_original) {
    if (backend_.remove(job.candidate.path, err)) {
      LOG_INFO("Deleted original {}", job.candidate.path);
    } else {
      LOG_WARN("Converted but could not delete original {}: {}",
               job.candidate.path, err);
    }
  }

  TIMER_END(commit);
  result.outcome = JobOutcome::Committed;
  result.error = ErrorKind::None;
  return result;
}

} // namespace vconv

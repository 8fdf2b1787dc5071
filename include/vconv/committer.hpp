/**
 * @file committer.hpp
 * @brief Ordered, crash-safe completion of a converted Job
 *
 * @details commit() performs, in this order and never another:
 *
 *          1. Upload the local output to `<destination>.vconv-partial` and
 *             rename it onto the destination (atomic finalize)
 *
 *          2. Apply the mtime policy to the destination (warning on failure)
 *
 *          3. Record the fingerprint in the ProcessedStore
 *
 *          4. Delete the source, only if originals are not kept
 *
 * @note A crash after 1 and before 3 leaves a visible output and an
 *       unrecorded fingerprint. The output is never lost and the source is
 *       never deleted before its fingerprint is durable.
 */

#ifndef VCONV_COMMITTER_HPP
#define VCONV_COMMITTER_HPP

#include <string>

#include "config.hpp"
#include "processed_store.hpp"
#include "transfer_backend.hpp"
#include "types.hpp"

namespace vconv {

class Committer {
public:
  Committer(TransferBackend &backend, ProcessedStore &store,
            const Settings &settings);

  /**
   * @brief Finalize job.staged_output at job.destination and record it.
   * @param should_abort Polled during the upload; true abandons the Job
   *        before anything becomes visible at the destination
   * @return Committed, Abandoned (upload cancelled), or Failed with
   *         TransferError (upload) or CommitError (rename, state persist)
   */
  JobResult commit(Job &job, const AbortCheck &should_abort = nullptr);

private:
  TransferBackend &backend_;
  ProcessedStore &store_;
  const Settings &settings_;

  void discard_partial(const std::string &partial);
};

/// Destination of a converted file: same directory, output extension
std::string output_path_for(const std::string &source,
                            const std::string &output_extension);

} // namespace vconv

#endif // VCONV_COMMITTER_HPP

/**
 * @file types.hpp
 * @brief Core data types shared by the discovery and conversion engine
 *
 * @details Contains the fundamental data structures used throughout the
 * daemon:
 *          - Candidate: a discovered file eligible for conversion
 *
 *          - Job: one candidate's transfer/convert/commit lifecycle
 *
 *          - JobState / JobOutcome / ErrorKind enumerations
 *
 *          - Transfer buffer sizing
 */

#ifndef VCONV_TYPES_HPP
#define VCONV_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace vconv {

// **----- CONSTANTS -----**

/**
 * @brief Size of the buffer used for local copies and SFTP transfers.
 * @note 64KB matches the largest SFTP packet payload libssh2 sends, so one
 *       read maps onto one wire request.
 */
constexpr size_t TRANSFER_CHUNK_SIZE = 64 * 1024; //< 64KB

/// Suffix of in-progress destination files (never a valid candidate)
constexpr const char *PARTIAL_SUFFIX = ".vconv-partial";

// **----- DATA STRUCTURES -----**

/**
 * @struct Candidate
 * @brief A discovered file eligible for conversion, not yet deduplicated.
 * @note Produced by the Scanner; treated as immutable afterwards.
 */
struct Candidate {
  std::string path;      //< Normalized absolute path (local or remote)
  std::string root;      //< Configured root the path was found under
  std::uint64_t size;    //< Size in bytes
  std::int64_t mtime;    //< Modification time (epoch seconds)
  std::string extension; //< Lowercase extension without the dot
};

/**
 * @brief Lifecycle of a Job.
 * @note Discovered -> Claimed -> Converting -> Committing -> Committed|Failed
 *       An abandoned Job ends as Failed: nothing was recorded for it.
 */
enum class JobState : std::uint8_t {
  Discovered,
  Claimed,
  Converting,
  Committing,
  Committed,
  Failed
};

/// Error taxonomy for failures surfaced by the engine.
enum class ErrorKind : std::uint8_t {
  None,
  Discovery,  //< Per-root listing failure (root skipped)
  Transfer,   //< Download/upload failure (retryable)
  Conversion, //< Encoder failure, timeout or unusable output (retryable)
  Commit,     //< Finalize or state-persist failure
  Config      //< Fatal, startup only
};

/// Terminal result of running one Job.
enum class JobOutcome : std::uint8_t {
  Committed, //< Output visible and fingerprint recorded
  Failed,    //< Retryable failure, fingerprint not recorded
  Abandoned  //< Shutdown grace expired, fingerprint not recorded
};

/**
 * @struct Job
 * @brief One candidate's full transfer-in/convert/transfer-out/commit unit.
 * @note Owned exclusively by the worker executing it until terminal state.
 */
struct Job {
  Candidate candidate;
  std::string fingerprint;   //< 64 lowercase hex chars
  std::string staged_input;  //< Local file the encoder reads
  std::string staged_output; //< Local file the encoder writes (work dir)
  std::string destination;   //< Final output path (same backend as source)
  JobState state = JobState::Discovered;
};

/**
 * @struct JobResult
 * @brief Outcome of a Job plus the classified error, if any.
 */
struct JobResult {
  JobOutcome outcome = JobOutcome::Failed;
  ErrorKind error = ErrorKind::None;
  std::string message;
};

const char *to_string(JobState state);
const char *to_string(ErrorKind kind);
const char *to_string(JobOutcome outcome);

} // namespace vconv

#endif // VCONV_TYPES_HPP

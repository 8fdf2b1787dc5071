/**
 * @file types.cpp
 * @brief Textual names for the engine enumerations
 */

#include "vconv/types.hpp"

namespace vconv {

const char *to_string(JobState state) {
  switch (state) {
  case JobState::Discovered:
    return "discovered";
  case JobState::Claimed:
    return "claimed";
  case JobState::Converting:
    return "converting";
  case JobState::Committing:
    return "committing";
  case JobState::Committed:
    return "committed";
  case JobState::Failed:
    return "failed";
  }
  return "unknown";
}

const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "none";
  case ErrorKind::Discovery:
    return "DiscoveryError";
  case ErrorKind::Transfer:
    return "TransferError";
  case ErrorKind::Conversion:
    return "ConversionError";
  case ErrorKind::Commit:
    return "CommitError";
  case ErrorKind::Config:
    return "ConfigError";
  }
  return "unknown";
}

const char *to_string(JobOutcome outcome) {
  switch (outcome) {
  case JobOutcome::Committed:
    return "committed";
  case JobOutcome::Failed:
    return "failed";
  case JobOutcome::Abandoned:
    return "abandoned";
  }
  return "unknown";
}

} // namespace vconv

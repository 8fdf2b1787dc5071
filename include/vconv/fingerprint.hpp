/**
 * @file fingerprint.hpp
 * @brief Path-keyed job identity
 *
 * @details A fingerprint is the SHA-256 of a candidate's lexically
 *          normalized absolute path, rendered as 64 lowercase hex
 *          characters. File content is never read: a file edited in place
 *          after being committed keeps its fingerprint and is not revisited.
 */

#ifndef VCONV_FINGERPRINT_HPP
#define VCONV_FINGERPRINT_HPP

#include <cstddef>
#include <string>

namespace vconv {

/// Length of a rendered fingerprint
constexpr size_t FINGERPRINT_LENGTH = 64;

/**
 * @brief Lexically normalize a path ("a//b/./c" -> "a/b/c", "x/../y" -> "y").
 * @note No filesystem access; symlinks are not resolved.
 */
std::string canonical_path(const std::string &path);

/**
 * @brief Compute the fingerprint of a path.
 * @throws std::runtime_error if the digest cannot be computed
 */
std::string fingerprint_of(const std::string &path);

/// true if s is exactly 64 lowercase hex characters
bool is_valid_fingerprint(const std::string &s);

} // namespace vconv

#endif // VCONV_FINGERPRINT_HPP

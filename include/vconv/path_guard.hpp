/**
 * @file path_guard.hpp
 * @brief Lexical path containment checks
 *
 * @details Pure string operations, no I/O. Used by the SFTP backend to
 *          reject `..` traversal before touching the remote host, and by
 *          the scanner to keep resolved symlinks inside the root being
 *          walked.
 */

#ifndef VCONV_PATH_GUARD_HPP
#define VCONV_PATH_GUARD_HPP

#include <string>
#include <vector>

namespace vconv {

/// true if any '/'-separated segment of path is exactly ".."
bool has_parent_segment(const std::string &path);

/**
 * @brief Collapse "//" and "/./", strip a trailing '/'.
 * @note ".." segments are left untouched; reject them first.
 */
std::string collapse_path(const std::string &path);

/**
 * @brief true if path equals root or lies below it.
 * @note Component-wise: "/data/videos2" is not inside "/data/videos".
 */
bool path_within_root(const std::string &path, const std::string &root);

bool path_within_roots(const std::string &path,
                       const std::vector<std::string> &roots);

/**
 * @brief Full lexical validation of a remote path.
 * @return false with err set if the path is relative, contains "..", or
 *         lies outside every root
 */
bool check_remote_path(const std::string &path,
                       const std::vector<std::string> &roots, std::string &err);

/// Parent directory of an absolute path ("/a/b" -> "/a", "/a" -> "/")
std::string parent_path(const std::string &path);

/// Join with exactly one '/' between the parts
std::string join_path(const std::string &dir, const std::string &name);

} // namespace vconv

#endif // VCONV_PATH_GUARD_HPP

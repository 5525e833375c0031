/**
 * @file file_discovery.hpp
 * @brief Recursive enumeration of the source directory.
 *
 * Produces the candidate files of a run. Only regular files are reported; directories,
 * symlinks to directories and special files are skipped.
 */

#ifndef FILE_DISCOVERY_HPP
#define FILE_DISCOVERY_HPP

#include "transfer_error.hpp"
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief A regular file found under the source directory.
 */
struct Candidate {
    std::filesystem::path path; ///< Full path of the file; its filename is the remote and backup name.
    std::string extension;      ///< Lower-cased extension with dot, empty if none.
};

/**
 * @brief Computes the lower-cased extension of a path.
 *
 * Dotfiles without a further dot (".profile") and names ending in a bare dot ("report.")
 * have no extension.
 */
std::string lowerExtension(const std::filesystem::path& path);

/**
 * @brief Recursively lists the regular files under a directory.
 *
 * Directory symlinks are not followed and unreadable subdirectories are skipped. The result
 * is in filesystem traversal order.
 *
 * @param rootDir Directory to scan.
 * @return std::expected<std::vector<Candidate>, TransferError> Candidates, or a
 *         DirectoryNotFoundError if rootDir is missing, not a directory, or vanishes mid-scan.
 */
std::expected<std::vector<Candidate>, TransferError> discoverFiles(const std::filesystem::path& rootDir);

#endif // FILE_DISCOVERY_HPP

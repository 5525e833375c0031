/**
 * @file backup_mover.hpp
 * @brief Moves uploaded files out of the source tree into the backup directory.
 */

#ifndef BACKUP_MOVER_HPP
#define BACKUP_MOVER_HPP

#include "transfer_error.hpp"
#include <expected>
#include <filesystem>

/**
 * @brief Result of a successful backup move.
 */
struct BackupMove {
    std::filesystem::path target;  ///< Final location inside the backup directory.
    bool replacedExisting = false; ///< True if a file with the same name was overwritten.
};

/**
 * @brief Moves a file into a flat backup directory under its basename.
 *
 * Uses rename, falling back to moveByCopy() when the backup directory lives on another
 * filesystem. An existing backup file with the same name is replaced.
 *
 * @param sourceFile File to move.
 * @param backupDir Existing backup directory.
 * @return std::expected<BackupMove, TransferError> The move, or a MoveError if the backup
 *         directory is missing or the filesystem refuses the move. On error the source file
 *         is left where it was.
 */
std::expected<BackupMove, TransferError> moveToBackup(const std::filesystem::path& sourceFile,
                                                      const std::filesystem::path& backupDir);

/**
 * @brief Moves a file by copying it, used when rename crosses filesystems.
 *
 * The file is copied to "<targetPath>.part", the source is removed, and the copy is renamed
 * over targetPath. An existing file at targetPath stays intact until the copy is complete;
 * if the copy or the removal of the source fails, the partial copy is deleted and the source
 * is left in place.
 *
 * @param sourceFile File to move.
 * @param targetPath Final path of the file.
 * @return std::expected<void, TransferError> Success or a MoveError.
 */
std::expected<void, TransferError> moveByCopy(const std::filesystem::path& sourceFile,
                                              const std::filesystem::path& targetPath);

#endif // BACKUP_MOVER_HPP

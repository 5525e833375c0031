#include "backup_mover.hpp"
#include <system_error>

namespace fs = std::filesystem;

namespace {

TransferError moveError(const fs::path& sourceFile, const fs::path& target, const std::string& reason) {
    return TransferError{ErrorKind::MoveError,
                         "Error while moving file " + sourceFile.string() + " to backup path " + target.string() + ": " + reason,
                         {}, {}};
}

} // namespace

std::expected<BackupMove, TransferError> moveToBackup(const fs::path& sourceFile, const fs::path& backupDir) {
    auto targetPath = backupDir / sourceFile.filename();

    std::error_code ec;
    if (!fs::is_directory(backupDir, ec) || ec) {
        return std::unexpected(moveError(sourceFile, targetPath, "backup directory does not exist"));
    }

    BackupMove result{targetPath, false};
    std::error_code existsErr;
    result.replacedExisting = fs::exists(targetPath, existsErr) && !existsErr;

    std::error_code renameErr;
    fs::rename(sourceFile, targetPath, renameErr);
    if (!renameErr) {
        return result;
    }

    if (renameErr != std::errc::cross_device_link) {
        return std::unexpected(moveError(sourceFile, targetPath, renameErr.message()));
    }

    auto moved = moveByCopy(sourceFile, targetPath);
    if (!moved) {
        return std::unexpected(moved.error());
    }
    return result;
}

std::expected<void, TransferError> moveByCopy(const fs::path& sourceFile, const fs::path& targetPath) {
    fs::path partPath = targetPath;
    partPath += ".part";

    std::error_code copyErr;
    fs::copy_file(sourceFile, partPath, fs::copy_options::overwrite_existing, copyErr);
    if (copyErr) {
        std::error_code cleanupErr;
        fs::remove(partPath, cleanupErr);
        return std::unexpected(moveError(sourceFile, targetPath, copyErr.message()));
    }

    // Source goes before the rename: a failure here leaves the file in the source tree only.
    std::error_code removeErr;
    fs::remove(sourceFile, removeErr);
    if (removeErr) {
        std::error_code cleanupErr;
        fs::remove(partPath, cleanupErr);
        return std::unexpected(moveError(sourceFile, targetPath, "failed to remove original: " + removeErr.message()));
    }

    std::error_code renameErr;
    fs::rename(partPath, targetPath, renameErr);
    if (renameErr) {
        return std::unexpected(moveError(sourceFile, targetPath,
                                         "file kept as " + partPath.string() + ": " + renameErr.message()));
    }
    return {};
}

#include "batch_processor.hpp"
#include "backup_mover.hpp"
#include "extension_filter.hpp"
#include <exception>
#include <string>

const char* toString(FileState state) {
    switch (state) {
    case FileState::Skipped:
        return "Skipped";
    case FileState::UploadFailed:
        return "UploadFailed";
    case FileState::Uploaded:
        return "Uploaded";
    case FileState::BackedUp:
        return "BackedUp";
    case FileState::MoveFailed:
        return "MoveFailed";
    }
    return "Unknown";
}

std::vector<FileReport> RunSummary::filesIn(FileState state) const {
    std::vector<FileReport> matching;
    for (const auto& report : files) {
        if (report.state == state) {
            matching.push_back(report);
        }
    }
    return matching;
}

BatchProcessor::BatchProcessor(TransferConfig config, std::unique_ptr<RemoteTransferStrategy> transferStrategy, Logger& logger)
    : config_(std::move(config)), transferStrategy_(std::move(transferStrategy)), logger_(logger) {}

std::expected<RunSummary, TransferError> BatchProcessor::run() {
    if (auto valid = config_.validate(); !valid) {
        logger_.error(valid.error().message);
        return std::unexpected(valid.error());
    }
    if (!transferStrategy_) {
        TransferError error{ErrorKind::ConfigurationError, "No transfer strategy configured", {}, {}};
        logger_.error(error.message);
        return std::unexpected(error);
    }

    if (!config_.backupEnabled) {
        logger_.info("Note: Backups are disabled.");
    }

    auto discovered = discoverFiles(config_.sourceDir);
    if (!discovered) {
        logger_.error(discovered.error().message);
        return std::unexpected(discovered.error());
    }

    RunSummary summary;
    summary.considered = discovered->size();

    std::vector<Candidate> pending;
    for (auto& candidate : *discovered) {
        if (!shouldProcess(candidate.extension, config_.filter)) {
            logger_.debug("Skipping " + candidate.path.string());
            summary.files.push_back(FileReport{candidate.path, FileState::Skipped, std::nullopt});
            ++summary.skipped;
            continue;
        }
        pending.push_back(std::move(candidate));
    }

    logger_.info(std::to_string(pending.size()) + " files need processing.");

    for (const auto& candidate : pending) {
        summary.files.push_back(processFile(candidate, summary));
    }

    logger_.info("Processed " + std::to_string(summary.succeeded) + " files.");
    logger_.debug("Run summary: considered=" + std::to_string(summary.considered) +
                  " skipped=" + std::to_string(summary.skipped) +
                  " attempted=" + std::to_string(summary.attempted) +
                  " succeeded=" + std::to_string(summary.succeeded) +
                  " backed_up=" + std::to_string(summary.backedUp) +
                  " upload_failed=" + std::to_string(summary.uploadFailed) +
                  " move_failed=" + std::to_string(summary.moveFailed));
    return summary;
}

FileReport BatchProcessor::processFile(const Candidate& candidate, RunSummary& summary) {
    logger_.debug("Processing " + candidate.path.string());
    ++summary.attempted;

    TransferOutcome outcome;
    try {
        outcome = transferStrategy_->transfer(candidate.path);
    } catch (const std::exception& e) {
        outcome = std::unexpected(TransferError{ErrorKind::UnexpectedError, e.what(), config_.destination.host,
                                                remoteFilePath(config_.destination.remoteDir, candidate.path)});
    }

    if (!outcome) {
        ++summary.uploadFailed;
        logger_.error("Error occurred at file " + candidate.path.string() + ": " + outcome.error().describe());
        return FileReport{candidate.path, FileState::UploadFailed, outcome.error()};
    }

    ++summary.succeeded;
    if (!config_.backupEnabled) {
        return FileReport{candidate.path, FileState::Uploaded, std::nullopt};
    }

    auto moved = moveToBackup(candidate.path, config_.backupDir);
    if (!moved) {
        ++summary.moveFailed;
        logger_.error(moved.error().message);
        return FileReport{candidate.path, FileState::MoveFailed, moved.error()};
    }

    if (moved->replacedExisting) {
        logger_.warning("Replaced existing backup file " + moved->target.string());
    }
    ++summary.backedUp;
    return FileReport{candidate.path, FileState::BackedUp, std::nullopt};
}

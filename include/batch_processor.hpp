/**
 * @file batch_processor.hpp
 * @brief Batch transfer pipeline for SftpTransfer.
 *
 * Drains the source directory: discover, filter, upload each file over its own connection
 * and, after a successful upload, move it into the backup directory. Files are processed
 * strictly one after another, and a failure on one file never stops the others.
 */

#ifndef BATCH_PROCESSOR_HPP
#define BATCH_PROCESSOR_HPP

#include "file_discovery.hpp"
#include "remote_transfer.hpp"
#include "transfer_config.hpp"
#include "transfer_error.hpp"
#include "transfer_log.hpp"
#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

/**
 * @brief Terminal state of one discovered file.
 */
enum class FileState {
    Skipped,      ///< Rejected by the extension filter; never attempted.
    UploadFailed, ///< Upload failed; file left in the source directory.
    Uploaded,     ///< Uploaded; backups disabled, file left in place.
    BackedUp,     ///< Uploaded and moved to the backup directory.
    MoveFailed    ///< Uploaded but the backup move failed; file left in the source directory.
};

const char* toString(FileState state);

/**
 * @brief What happened to one file during a run.
 */
struct FileReport {
    std::filesystem::path path;         ///< Source path of the file.
    FileState state;                    ///< Terminal state.
    std::optional<TransferError> error; ///< Failure detail for UploadFailed and MoveFailed.
};

/**
 * @brief Counters and per-file reports of a run.
 */
struct RunSummary {
    std::size_t considered = 0;   ///< Regular files discovered.
    std::size_t skipped = 0;      ///< Rejected by the filter.
    std::size_t attempted = 0;    ///< Upload attempts.
    std::size_t succeeded = 0;    ///< Successful uploads.
    std::size_t backedUp = 0;     ///< Successful backup moves.
    std::size_t uploadFailed = 0; ///< Failed uploads.
    std::size_t moveFailed = 0;   ///< Failed backup moves.
    std::vector<FileReport> files; ///< One report per discovered file, in processing order.

    /**
     * @brief Returns the reports in the given state.
     */
    std::vector<FileReport> filesIn(FileState state) const;
};

/**
 * @brief Runs the batch transfer pipeline.
 */
class BatchProcessor {
public:
    /**
     * @brief Constructs a batch processor.
     *
     * @param config Run configuration, copied and fixed for the lifetime of the processor.
     * @param transferStrategy Strategy performing one upload per call.
     * @param logger Sink for run events; must outlive the processor.
     */
    BatchProcessor(TransferConfig config, std::unique_ptr<RemoteTransferStrategy> transferStrategy, Logger& logger);

    /**
     * @brief Processes every eligible file under the source directory once.
     *
     * Validates the configuration and discovers the files first; either failing aborts the
     * run before any file is touched. Per-file upload and move failures are logged and
     * recorded in the summary.
     *
     * @return std::expected<RunSummary, TransferError> Summary of the run, or the fatal error.
     */
    std::expected<RunSummary, TransferError> run();

private:
    /**
     * @brief Uploads one file and, on success, moves it to the backup directory.
     */
    FileReport processFile(const Candidate& candidate, RunSummary& summary);

    TransferConfig config_;                                    ///< Run configuration.
    std::unique_ptr<RemoteTransferStrategy> transferStrategy_; ///< Upload strategy.
    Logger& logger_;                                           ///< Event sink.
};

#endif // BATCH_PROCESSOR_HPP

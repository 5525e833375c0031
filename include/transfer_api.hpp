/**
 * @file transfer_api.hpp
 * @brief High-level entry point for running an SftpTransfer batch.
 *
 * Loads the configuration, sets up logging and the SFTP strategy, and runs one batch.
 */

#ifndef TRANSFER_API_HPP
#define TRANSFER_API_HPP

#include "batch_processor.hpp"
#include <expected>
#include <string>

/**
 * @brief API for running transfer batches.
 */
class TransferAPI {
public:
    /**
     * @brief Runs one batch using the given configuration file.
     *
     * Any fatal condition (unreadable config, failed validation, unhandled exception) is
     * logged and returned as an error; per-file failures are part of the summary.
     *
     * @param configFile Path to the JSON configuration file.
     * @return std::expected<RunSummary, std::string> Summary of the run or an error message.
     */
    static std::expected<RunSummary, std::string> run(const std::string& configFile);
};

#endif // TRANSFER_API_HPP

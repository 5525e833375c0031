/**
 * @file remote_transfer.hpp
 * @brief Defines remote transfer strategies for SftpTransfer.
 *
 * Provides the interface for uploading a single file to the remote destination and its SFTP
 * implementation. Every upload is one attempt over its own connection; failures are returned
 * as classified TransferError values, never thrown.
 *
 * @note Requires libssh for SFTP transfers.
 */

#ifndef REMOTE_TRANSFER_HPP
#define REMOTE_TRANSFER_HPP

#include "transfer_config.hpp"
#include "transfer_error.hpp"
#include <expected>
#include <filesystem>
#include <string>

/**
 * @brief Outcome of one upload attempt.
 */
using TransferOutcome = std::expected<void, TransferError>;

/**
 * @brief Interface for remote transfer strategies.
 *
 * Defines the contract for uploading one local file to the configured remote directory.
 */
class RemoteTransferStrategy {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~RemoteTransferStrategy() = default;

    /**
     * @brief Uploads a local file under its basename, overwriting a remote file of the same name.
     *
     * @param localFile Path to the local file.
     * @return TransferOutcome Success, or the classified failure.
     */
    virtual TransferOutcome transfer(const std::filesystem::path& localFile) = 0;
};

/**
 * @brief Joins the remote directory and the basename of a local file.
 *
 * @param remoteDir Remote directory, with or without trailing slash.
 * @param localFile Local file whose basename is used.
 * @return std::string e.g. "/upload/in/a.csv".
 */
std::string remoteFilePath(const std::string& remoteDir, const std::filesystem::path& localFile);

/**
 * @brief Checks the destination arguments before any network activity.
 *
 * @return TransferOutcome Success, or a ProtocolError for an empty host or user, or a port
 *         outside 1..65535.
 */
TransferOutcome validateDestination(const RemoteDestination& destination);

/**
 * @brief Classifies the SFTP status code of a failed remote open, write or close.
 *
 * @param status Value of sftp_get_error() after the failure.
 * @return ErrorKind PermissionError for permission denied or a write-protected filesystem,
 *         ProtocolError otherwise.
 */
ErrorKind classifySftpStatus(int status);

/**
 * @brief Human readable text for an SFTP status code, e.g. "no such file or directory (SFTP status 2)".
 */
std::string describeSftpStatus(int status);

/**
 * @brief SFTP remote transfer strategy.
 *
 * Opens a new SSH session per file, authenticates by private key when one is configured and
 * by password otherwise, writes the file through an SFTP channel, and releases every handle
 * on all exit paths.
 */
class SFTPTransferStrategy : public RemoteTransferStrategy {
public:
    /**
     * @brief Constructs an SFTP transfer strategy.
     *
     * @param destination Remote endpoint and credentials, fixed for the run.
     */
    explicit SFTPTransferStrategy(RemoteDestination destination);

    /**
     * @brief Transfers a file via SFTP.
     *
     * @param localFile Path to the local file.
     * @return TransferOutcome Success, or a ProtocolError, ConnectionError,
     *         AuthenticationError or PermissionError.
     */
    TransferOutcome transfer(const std::filesystem::path& localFile) override;

private:
    RemoteDestination destination_; ///< Remote endpoint and credentials.
};

#endif // REMOTE_TRANSFER_HPP

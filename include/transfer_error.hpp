/**
 * @file transfer_error.hpp
 * @brief Error taxonomy shared by every stage of the SftpTransfer pipeline.
 *
 * Errors are plain values carried inside std::expected. Fatal kinds abort a run before any
 * file is touched; per-file kinds are recorded against a single file and the run continues.
 */

#ifndef TRANSFER_ERROR_HPP
#define TRANSFER_ERROR_HPP

#include <string>

/**
 * @brief Classification of everything that can go wrong during a run.
 */
enum class ErrorKind {
    ConfigurationError,     ///< Fatal: required setting missing or invalid.
    DirectoryNotFoundError, ///< Fatal: source or backup directory missing.
    AuthenticationError,    ///< Per file: remote host rejected the credentials.
    PermissionError,        ///< Per file: local or remote permission denied.
    ProtocolError,          ///< Per file: malformed destination or SSH/SFTP protocol failure.
    ConnectionError,        ///< Per file: connect or handshake failure.
    MoveError,              ///< Per file: uploaded file could not be moved to the backup directory.
    UnexpectedError         ///< Per file: unclassified failure escaping the transfer client.
};

/**
 * @brief Returns the stable name of an error kind (e.g. "ConnectionError").
 */
const char* toString(ErrorKind kind);

/**
 * @brief Error value with enough context to identify the file and the remote target.
 */
struct TransferError {
    ErrorKind kind;          ///< Error classification.
    std::string message;     ///< Human readable detail.
    std::string host;        ///< Remote host involved, if any.
    std::string remotePath;  ///< Remote file path involved, if any.

    /**
     * @brief Formats the error for a log record.
     *
     * @return std::string e.g. "PermissionError on sftp.example.com:/in/a.csv: permission denied".
     */
    std::string describe() const;

    /**
     * @brief True for kinds that abort a whole run.
     */
    bool isFatal() const;
};

#endif // TRANSFER_ERROR_HPP

/**
 * @file transfer_config.hpp
 * @brief Configuration management for SftpTransfer.
 *
 * Defines the run settings (source tree, extension policy, remote destination, backup and
 * logging options) and loads them from a JSON file. The loaded configuration is read-only
 * for the duration of a run.
 *
 * @note Relative paths in the JSON file are resolved against the directory holding the file.
 */

#ifndef TRANSFER_CONFIG_HPP
#define TRANSFER_CONFIG_HPP

#include "extension_filter.hpp"
#include "transfer_error.hpp"
#include <expected>
#include <filesystem>
#include <string>
#include <json/json.h>

/**
 * @brief Remote SFTP endpoint and credentials.
 *
 * If privateKeyPath is non-empty the key is used for authentication and password is ignored.
 */
struct RemoteDestination {
    std::string host;                 ///< SFTP host address.
    int port = 22;                    ///< SSH port.
    std::string user;                 ///< SSH username.
    std::string password;             ///< Password for password authentication.
    std::string privateKeyPath;       ///< Private key file for key authentication.
    std::string privateKeyPassphrase; ///< Optional passphrase of the private key.
    std::string remoteDir;            ///< Flat remote directory receiving every file.
    long timeoutSeconds = 30;         ///< Connect timeout.
    bool verifyHostKey = false;       ///< Require the host key to be present in known_hosts.
};

/**
 * @brief Logging sink selection and verbosity.
 */
struct LogSettings {
    std::string method = "file";   ///< "file", "console" or "graylog".
    std::string level = "info";    ///< "debug", "info", "warning", "error" or "critical".
    std::filesystem::path logDir;  ///< Directory for the daily log file.
    std::string graylogHost;       ///< Graylog GELF HTTP input host.
    int graylogPort = 12201;       ///< Graylog GELF HTTP input port; messages go over HTTP POST, not UDP.
};

/**
 * @brief Configuration of one batch run.
 */
struct TransferConfig {
    /**
     * @brief Loads a configuration from a JSON file.
     *
     * @param configFile Path to the JSON configuration file.
     * @return TransferConfig Settings with defaults applied.
     * @throws std::runtime_error If the file cannot be opened or parsed.
     */
    static TransferConfig fromFile(const std::string& configFile);

    /**
     * @brief Builds a configuration from parsed JSON.
     *
     * @param json Parsed configuration object.
     * @param baseDir Directory used for defaults and to resolve relative paths.
     * @return TransferConfig Settings with defaults applied.
     */
    static TransferConfig fromJson(const Json::Value& json, const std::filesystem::path& baseDir);

    /**
     * @brief Checks the settings before any file is touched.
     *
     * Destination host, user and path must be set; the source directory must exist and, if
     * backups are enabled, so must the backup directory.
     *
     * @return std::expected<void, TransferError> Success, or a ConfigurationError /
     *         DirectoryNotFoundError describing the first violation.
     */
    std::expected<void, TransferError> validate() const;

    std::filesystem::path sourceDir;  ///< Inbox directory scanned recursively.
    FilterPolicy filter;              ///< Extension policy applied to discovered files.
    RemoteDestination destination;    ///< Remote SFTP endpoint.
    bool backupEnabled = true;        ///< Move uploaded files to backupDir.
    std::filesystem::path backupDir;  ///< Flat backup directory.
    LogSettings logging;              ///< Logging sink settings.
};

#endif // TRANSFER_CONFIG_HPP

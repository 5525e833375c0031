/**
 * @file sftp_transfer.cpp
 * @brief SFTP upload over libssh.
 *
 * Every libssh handle is owned by a unique_ptr so the remote file, the SFTP channel and the
 * SSH session are released in reverse order on every return path.
 */

#include "remote_transfer.hpp"
#include <libssh/libssh.h>
#include <libssh/sftp.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <memory>

namespace fs = std::filesystem;

namespace {

struct SessionDeleter {
    void operator()(ssh_session session) const {
        if (ssh_is_connected(session)) {
            ssh_disconnect(session);
        }
        ssh_free(session);
    }
};

struct SftpDeleter {
    void operator()(sftp_session sftp) const { sftp_free(sftp); }
};

struct SftpFileDeleter {
    void operator()(sftp_file file) const { sftp_close(file); }
};

struct KeyDeleter {
    void operator()(ssh_key key) const { ssh_key_free(key); }
};

using SessionHandle = std::unique_ptr<ssh_session_struct, SessionDeleter>;
using SftpHandle = std::unique_ptr<sftp_session_struct, SftpDeleter>;
using SftpFileHandle = std::unique_ptr<sftp_file_struct, SftpFileDeleter>;
using KeyHandle = std::unique_ptr<ssh_key_struct, KeyDeleter>;

constexpr size_t kChunkSize = 16384;

// SSH_FX_OK after a failed call means the channel itself broke; the session error says why.
std::string remoteFailureDetail(ssh_session ssh, int status) {
    if (status == SSH_FX_OK) {
        return ssh_get_error(ssh);
    }
    return describeSftpStatus(status);
}

} // namespace

ErrorKind classifySftpStatus(int status) {
    if (status == SSH_FX_PERMISSION_DENIED || status == SSH_FX_WRITE_PROTECT) {
        return ErrorKind::PermissionError;
    }
    return ErrorKind::ProtocolError;
}

std::string describeSftpStatus(int status) {
    std::string text;
    switch (status) {
    case SSH_FX_OK:
        text = "ok";
        break;
    case SSH_FX_EOF:
        text = "end of file";
        break;
    case SSH_FX_NO_SUCH_FILE:
        text = "no such file or directory";
        break;
    case SSH_FX_PERMISSION_DENIED:
        text = "permission denied";
        break;
    case SSH_FX_FAILURE:
        text = "generic failure";
        break;
    case SSH_FX_BAD_MESSAGE:
        text = "bad message";
        break;
    case SSH_FX_NO_CONNECTION:
        text = "no connection";
        break;
    case SSH_FX_CONNECTION_LOST:
        text = "connection lost";
        break;
    case SSH_FX_OP_UNSUPPORTED:
        text = "operation unsupported";
        break;
    case SSH_FX_NO_SUCH_PATH:
        text = "no such path";
        break;
    case SSH_FX_FILE_ALREADY_EXISTS:
        text = "file already exists";
        break;
    case SSH_FX_WRITE_PROTECT:
        text = "write protected filesystem";
        break;
    case SSH_FX_NO_MEDIA:
        text = "no media";
        break;
    default:
        text = "unknown error";
        break;
    }
    return text + " (SFTP status " + std::to_string(status) + ")";
}

SFTPTransferStrategy::SFTPTransferStrategy(RemoteDestination destination)
    : destination_(std::move(destination)) {}

TransferOutcome SFTPTransferStrategy::transfer(const fs::path& localFile) {
    if (auto valid = validateDestination(destination_); !valid) {
        return valid;
    }

    const std::string& host = destination_.host;
    const std::string remoteFile = remoteFilePath(destination_.remoteDir, localFile);
    auto failure = [&](ErrorKind kind, const std::string& message) {
        return TransferOutcome(std::unexpect, TransferError{kind, message, host, remoteFile});
    };

    // The key is loaded before connecting so an unusable key costs no connection.
    KeyHandle key;
    if (!destination_.privateKeyPath.empty()) {
        ssh_key rawKey = nullptr;
        const char* passphrase = destination_.privateKeyPassphrase.empty() ? nullptr
                                                                           : destination_.privateKeyPassphrase.c_str();
        if (ssh_pki_import_privkey_file(destination_.privateKeyPath.c_str(), passphrase, nullptr, nullptr, &rawKey) != SSH_OK) {
            return failure(ErrorKind::AuthenticationError, "Failed to load private key " + destination_.privateKeyPath);
        }
        key.reset(rawKey);
    }

    SessionHandle ssh(ssh_new());
    if (!ssh) {
        return failure(ErrorKind::ProtocolError, "Failed to create SSH session");
    }

    int port = destination_.port;
    long timeout = destination_.timeoutSeconds;
    if (ssh_options_set(ssh.get(), SSH_OPTIONS_HOST, host.c_str()) < 0 ||
        ssh_options_set(ssh.get(), SSH_OPTIONS_PORT, &port) < 0 ||
        ssh_options_set(ssh.get(), SSH_OPTIONS_USER, destination_.user.c_str()) < 0 ||
        (timeout > 0 && ssh_options_set(ssh.get(), SSH_OPTIONS_TIMEOUT, &timeout) < 0)) {
        return failure(ErrorKind::ProtocolError, std::string("Invalid SSH options: ") + ssh_get_error(ssh.get()));
    }

    if (ssh_connect(ssh.get()) != SSH_OK) {
        return failure(ErrorKind::ConnectionError, std::string("SSH connection failed: ") + ssh_get_error(ssh.get()));
    }

    if (destination_.verifyHostKey) {
        ssh_known_hosts_e known = ssh_session_is_known_server(ssh.get());
        if (known != SSH_KNOWN_HOSTS_OK) {
            return failure(ErrorKind::ConnectionError, "Host key of " + host + " is not trusted (known_hosts state " +
                                                           std::to_string(static_cast<int>(known)) + ")");
        }
    }

    int authResult = SSH_AUTH_ERROR;
    if (key) {
        authResult = ssh_userauth_publickey(ssh.get(), nullptr, key.get());
    } else {
        authResult = ssh_userauth_password(ssh.get(), nullptr, destination_.password.c_str());
    }

    if (authResult == SSH_AUTH_ERROR) {
        return failure(ErrorKind::ProtocolError, std::string("SSH authentication error: ") + ssh_get_error(ssh.get()));
    }
    if (authResult != SSH_AUTH_SUCCESS) {
        return failure(ErrorKind::AuthenticationError, "ssh authentication rejected for user " + destination_.user);
    }

    SftpHandle sftp(sftp_new(ssh.get()));
    if (!sftp) {
        return failure(ErrorKind::ProtocolError, std::string("SFTP session creation failed: ") + ssh_get_error(ssh.get()));
    }
    if (sftp_init(sftp.get()) != SSH_OK) {
        return failure(ErrorKind::ProtocolError, "SFTP initialization failed (code " +
                                                     std::to_string(sftp_get_error(sftp.get())) + ")");
    }

    std::ifstream input(localFile, std::ios::binary);
    if (!input) {
        int err = errno;
        ErrorKind kind = (err == EACCES || err == EPERM) ? ErrorKind::PermissionError : ErrorKind::ProtocolError;
        return failure(kind, "Failed to open local file " + localFile.string() + ": " + std::strerror(err));
    }

    SftpFileHandle file(sftp_open(sftp.get(), remoteFile.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
    if (!file) {
        int status = sftp_get_error(sftp.get());
        return failure(classifySftpStatus(status),
                       "Failed to open remote file: " + remoteFailureDetail(ssh.get(), status));
    }

    char buf[kChunkSize];
    while (input) {
        input.read(buf, sizeof(buf));
        std::streamsize count = input.gcount();
        if (count <= 0) {
            break;
        }
        ssize_t written = sftp_write(file.get(), buf, static_cast<size_t>(count));
        if (written != count) {
            int status = sftp_get_error(sftp.get());
            return failure(classifySftpStatus(status),
                           "Failed to write remote file: " + remoteFailureDetail(ssh.get(), status));
        }
    }
    if (input.bad()) {
        return failure(ErrorKind::ProtocolError, "Failed to read local file " + localFile.string());
    }

    if (sftp_close(file.release()) != SSH_NO_ERROR) {
        int status = sftp_get_error(sftp.get());
        return failure(classifySftpStatus(status),
                       "Failed to close remote file: " + remoteFailureDetail(ssh.get(), status));
    }
    return {};
}

#include "transfer_error.hpp"

const char* toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::ConfigurationError:
        return "ConfigurationError";
    case ErrorKind::DirectoryNotFoundError:
        return "DirectoryNotFoundError";
    case ErrorKind::AuthenticationError:
        return "AuthenticationError";
    case ErrorKind::PermissionError:
        return "PermissionError";
    case ErrorKind::ProtocolError:
        return "ProtocolError";
    case ErrorKind::ConnectionError:
        return "ConnectionError";
    case ErrorKind::MoveError:
        return "MoveError";
    case ErrorKind::UnexpectedError:
        return "UnexpectedError";
    }
    return "UnknownError";
}

std::string TransferError::describe() const {
    std::string text = toString(kind);
    if (!host.empty()) {
        text += " on " + host;
        if (!remotePath.empty()) {
            text += ":" + remotePath;
        }
    }
    if (!message.empty()) {
        text += ": " + message;
    }
    return text;
}

bool TransferError::isFatal() const {
    return kind == ErrorKind::ConfigurationError || kind == ErrorKind::DirectoryNotFoundError;
}

#include "remote_transfer.hpp"

std::string remoteFilePath(const std::string& remoteDir, const std::filesystem::path& localFile) {
    std::string dir = remoteDir;
    while (dir.size() > 1 && dir.back() == '/') {
        dir.pop_back();
    }
    std::string name = localFile.filename().string();
    if (dir == "/") {
        return dir + name;
    }
    return dir + "/" + name;
}

TransferOutcome validateDestination(const RemoteDestination& destination) {
    if (destination.host.empty()) {
        return std::unexpected(TransferError{ErrorKind::ProtocolError, "Destination host is empty", {}, {}});
    }
    if (destination.port < 1 || destination.port > 65535) {
        return std::unexpected(TransferError{ErrorKind::ProtocolError,
                                             "Invalid destination port " + std::to_string(destination.port),
                                             destination.host, {}});
    }
    if (destination.user.empty()) {
        return std::unexpected(TransferError{ErrorKind::ProtocolError, "SSH user is empty", destination.host, {}});
    }
    return {};
}

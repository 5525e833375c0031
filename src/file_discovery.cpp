#include "file_discovery.hpp"
#include <algorithm>
#include <cctype>
#include <system_error>

namespace fs = std::filesystem;

std::string lowerExtension(const fs::path& path) {
    std::string extension = path.extension().string();
    if (extension == ".") {
        return {};
    }
    std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return extension;
}

std::expected<std::vector<Candidate>, TransferError> discoverFiles(const fs::path& rootDir) {
    std::error_code ec;
    if (!fs::exists(rootDir, ec) || ec) {
        return std::unexpected(TransferError{ErrorKind::DirectoryNotFoundError,
                                             "Source path " + rootDir.string() + " does not exist", {}, {}});
    }
    if (!fs::is_directory(rootDir, ec) || ec) {
        return std::unexpected(TransferError{ErrorKind::DirectoryNotFoundError,
                                             "Source path " + rootDir.string() + " is not a directory", {}, {}});
    }

    fs::recursive_directory_iterator it(rootDir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return std::unexpected(TransferError{ErrorKind::DirectoryNotFoundError,
                                             "Unable to enumerate " + rootDir.string() + ": " + ec.message(), {}, {}});
    }

    std::vector<Candidate> candidates;
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return std::unexpected(TransferError{ErrorKind::DirectoryNotFoundError,
                                                 "Failed to scan " + rootDir.string() + ": " + ec.message(), {}, {}});
        }

        std::error_code typeErr;
        if (!it->is_regular_file(typeErr) || typeErr) {
            continue;
        }

        const auto& path = it->path();
        candidates.push_back(Candidate{path, lowerExtension(path)});
    }
    if (ec) {
        return std::unexpected(TransferError{ErrorKind::DirectoryNotFoundError,
                                             "Failed to scan " + rootDir.string() + ": " + ec.message(), {}, {}});
    }
    return candidates;
}

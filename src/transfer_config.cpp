#include "transfer_config.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace {

fs::path resolvePath(const Json::Value& json, const char* key, const fs::path& baseDir, const fs::path& fallback) {
    std::string value = json.get(key, "").asString();
    if (value.empty()) {
        return fallback;
    }
    fs::path path(value);
    return path.is_relative() ? baseDir / path : path;
}

// do_backup may be written as 0/1 or as a JSON boolean.
bool readFlag(const Json::Value& json, const char* key, bool fallback) {
    const Json::Value& value = json[key];
    if (value.isBool()) {
        return value.asBool();
    }
    if (value.isIntegral()) {
        return value.asInt() != 0;
    }
    if (value.isString()) {
        std::string text = value.asString();
        std::transform(text.begin(), text.end(), text.begin(), [](unsigned char ch) {
            return static_cast<char>(std::tolower(ch));
        });
        return !(text == "0" || text == "false" || text == "no" || text == "off");
    }
    return fallback;
}

int readInt(const Json::Value& json, const char* key, int fallback) {
    const Json::Value& value = json[key];
    if (value.isIntegral()) {
        return value.asInt();
    }
    if (value.isString() && !value.asString().empty()) {
        try {
            return std::stoi(value.asString());
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid integer for " + std::string(key) + ": " + value.asString());
        }
    }
    return fallback;
}

bool isWithin(const fs::path& path, const fs::path& root) {
    std::error_code pathErr;
    std::error_code rootErr;
    fs::path resolved = fs::weakly_canonical(path, pathErr);
    fs::path resolvedRoot = fs::weakly_canonical(root, rootErr);
    if (pathErr || rootErr) {
        return false;
    }
    auto mismatch = std::mismatch(resolvedRoot.begin(), resolvedRoot.end(), resolved.begin(), resolved.end());
    // a trailing separator leaves an empty final element on the root
    return mismatch.first == resolvedRoot.end() ||
           (std::next(mismatch.first) == resolvedRoot.end() && mismatch.first->empty());
}

} // namespace

TransferConfig TransferConfig::fromFile(const std::string& configFile) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + configFile);
    }
    Json::Value configJson;
    Json::CharReaderBuilder builder;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &configJson, &errors)) {
        throw std::runtime_error("Failed to parse config file: " + configFile + " (" + errors + ")");
    }
    if (!configJson.isObject()) {
        throw std::runtime_error("Config file is not a JSON object: " + configFile);
    }

    fs::path baseDir = fs::absolute(fs::path(configFile)).parent_path();
    return fromJson(configJson, baseDir);
}

TransferConfig TransferConfig::fromJson(const Json::Value& json, const fs::path& baseDir) {
    TransferConfig config;

    config.logging.method = json.get("log_method", "file").asString();
    config.logging.level = json.get("log_level", "info").asString();
    config.logging.logDir = resolvePath(json, "log_dir", baseDir, baseDir / "log");
    config.logging.graylogHost = json.get("graylog_host", "").asString();
    config.logging.graylogPort = readInt(json, "graylog_port", 12201);

    config.sourceDir = resolvePath(json, "source_dir", baseDir, baseDir / "input");
    config.filter = FilterPolicy::fromLists(json.get("source_include_ext", "").asString(),
                                            json.get("source_exclude_ext", "").asString());

    RemoteDestination& dest = config.destination;
    dest.host = json.get("dest_host", "").asString();
    dest.port = readInt(json, "dest_port", 22);
    dest.user = json.get("dest_user", "").asString();
    dest.password = json.get("dest_pwd", "").asString();
    dest.privateKeyPath = json.get("dest_key", "").asString();
    if (!dest.privateKeyPath.empty() && fs::path(dest.privateKeyPath).is_relative()) {
        dest.privateKeyPath = (baseDir / dest.privateKeyPath).string();
    }
    dest.privateKeyPassphrase = json.get("dest_key_pwd", "").asString();
    dest.remoteDir = json.get("dest_path", "").asString();
    dest.timeoutSeconds = readInt(json, "dest_timeout", 30);
    dest.verifyHostKey = readFlag(json, "dest_verify_host_key", false);

    config.backupEnabled = readFlag(json, "do_backup", true);
    config.backupDir = resolvePath(json, "backup_path", baseDir, baseDir / "backup");
    return config;
}

std::expected<void, TransferError> TransferConfig::validate() const {
    if (destination.host.empty()) {
        return std::unexpected(TransferError{ErrorKind::ConfigurationError, "No destination host set.", {}, {}});
    }
    if (destination.user.empty()) {
        return std::unexpected(TransferError{ErrorKind::ConfigurationError, "No ssh user set.", {}, {}});
    }
    if (destination.remoteDir.empty()) {
        return std::unexpected(TransferError{ErrorKind::ConfigurationError, "No destination path set.", {}, {}});
    }
    if (logging.method == "graylog" && logging.graylogHost.empty()) {
        return std::unexpected(TransferError{ErrorKind::ConfigurationError, "No graylog host set.", {}, {}});
    }

    std::error_code ec;
    if (!fs::is_directory(sourceDir, ec) || ec) {
        return std::unexpected(TransferError{ErrorKind::DirectoryNotFoundError,
                                             "source path " + sourceDir.string() + " does not exist.", {}, {}});
    }
    if (backupEnabled && (!fs::is_directory(backupDir, ec) || ec)) {
        return std::unexpected(TransferError{ErrorKind::DirectoryNotFoundError,
                                             "backup path " + backupDir.string() + " does not exist.", {}, {}});
    }
    // A backup directory under the source tree would be rediscovered and uploaded on every run.
    if (backupEnabled && isWithin(backupDir, sourceDir)) {
        return std::unexpected(TransferError{ErrorKind::ConfigurationError,
                                             "backup path " + backupDir.string() + " lies inside source path " +
                                                 sourceDir.string() + ".", {}, {}});
    }
    return {};
}

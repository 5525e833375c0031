#ifndef TEST_SUPPORT_HPP
#define TEST_SUPPORT_HPP

#include "remote_transfer.hpp"
#include "transfer_log.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include <unistd.h>

namespace testsupport {

// Scratch directory removed with everything in it when the object goes out of scope.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("sftptransfer-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path mkdir(const std::string& relative) const {
        auto dir = path_ / relative;
        std::filesystem::create_directories(dir);
        return dir;
    }

    std::filesystem::path write(const std::string& relative, const std::string& contents) const {
        auto file = path_ / relative;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary);
        out << contents;
        return file;
    }

private:
    std::filesystem::path path_;
};

inline std::string readFile(const std::filesystem::path& file) {
    std::ifstream in(file, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// Snapshot of every regular file under a directory: relative path -> contents.
inline std::map<std::string, std::string> snapshot(const std::filesystem::path& root) {
    std::map<std::string, std::string> files;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
        if (entry.is_regular_file()) {
            files[std::filesystem::relative(entry.path(), root).string()] = readFile(entry.path());
        }
    }
    return files;
}

// Logger keeping every record for inspection.
class RecordingLogger : public Logger {
public:
    explicit RecordingLogger(LogLevel threshold = LogLevel::Debug) : Logger(threshold) {}

    std::vector<std::pair<LogLevel, std::string>> records;

    bool contains(LogLevel level, const std::string& fragment) const {
        for (const auto& [recordLevel, message] : records) {
            if (recordLevel == level && message.find(fragment) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    std::size_t count(LogLevel level) const {
        std::size_t n = 0;
        for (const auto& record : records) {
            if (record.first == level) {
                ++n;
            }
        }
        return n;
    }

protected:
    void write(LogLevel level, const std::string& message) override {
        records.emplace_back(level, message);
    }
};

// Transfer strategy recording every call; the behavior decides the outcome per file.
class FakeTransferStrategy : public RemoteTransferStrategy {
public:
    using Behavior = std::function<TransferOutcome(const std::filesystem::path&)>;

    FakeTransferStrategy(std::vector<std::filesystem::path>& calls, Behavior behavior)
        : calls_(calls), behavior_(std::move(behavior)) {}

    TransferOutcome transfer(const std::filesystem::path& localFile) override {
        calls_.push_back(localFile);
        return behavior_(localFile);
    }

private:
    std::vector<std::filesystem::path>& calls_;
    Behavior behavior_;
};

inline FakeTransferStrategy::Behavior alwaysSucceed() {
    return [](const std::filesystem::path&) { return TransferOutcome{}; };
}

inline FakeTransferStrategy::Behavior alwaysFail(ErrorKind kind, const std::string& message) {
    return [kind, message](const std::filesystem::path& file) {
        return TransferOutcome(std::unexpect, TransferError{kind, message, "sftp.example.com",
                                                            "/inbox/" + file.filename().string()});
    };
}

} // namespace testsupport

#endif // TEST_SUPPORT_HPP

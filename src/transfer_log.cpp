/**
 * @file transfer_log.cpp
 * @brief Logger sinks: console, daily file and Graylog GELF over HTTP.
 */

#include "transfer_log.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <system_error>
#include <curl/curl.h>
#include <json/json.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

std::string timestamp(const char* format) {
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&timeT, &local);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), format, &local);
    return timeBuf;
}

int syslogSeverity(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return 7;
    case LogLevel::Info:
        return 6;
    case LogLevel::Warning:
        return 4;
    case LogLevel::Error:
        return 3;
    case LogLevel::Critical:
        return 2;
    }
    return 6;
}

size_t discardResponse([[maybe_unused]] void* contents, size_t size, size_t nmemb, [[maybe_unused]] void* userp) {
    return size * nmemb;
}

void writeConsole(LogLevel level, const std::string& line) {
    if (level >= LogLevel::Warning) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }
}

} // namespace

LogLevel parseLogLevel(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (lowered == "debug") {
        return LogLevel::Debug;
    }
    if (lowered == "warning") {
        return LogLevel::Warning;
    }
    if (lowered == "error") {
        return LogLevel::Error;
    }
    if (lowered == "critical") {
        return LogLevel::Critical;
    }
    return LogLevel::Info;
}

const char* toString(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Critical:
        return "CRITICAL";
    }
    return "INFO";
}

std::string formatLogLine(LogLevel level, const std::string& message) {
    return timestamp("%Y-%m-%d %H:%M:%S") + " " + toString(level) + " " + message;
}

Logger::Logger(LogLevel threshold) : threshold_(threshold) {}

void Logger::log(LogLevel level, const std::string& message) {
    if (level < threshold_) {
        return;
    }
    write(level, message);
}

ConsoleLogger::ConsoleLogger(LogLevel threshold) : Logger(threshold) {}

void ConsoleLogger::write(LogLevel level, const std::string& message) {
    writeConsole(level, formatLogLine(level, message));
}

FileLogger::FileLogger(fs::path logDir, LogLevel threshold)
    : Logger(threshold), logDir_(std::move(logDir)) {}

fs::path FileLogger::currentLogFile() const {
    return logDir_ / ("sftptransfer_" + timestamp("%Y_%m_%d") + ".log");
}

void FileLogger::write(LogLevel level, const std::string& message) {
    std::string logEntry = formatLogLine(level, message);
    writeConsole(level, logEntry);

    std::error_code ec;
    fs::create_directories(logDir_, ec);
    auto logFile = currentLogFile();
    std::ofstream log(logFile, std::ios::app);
    if (log.is_open()) {
        log << logEntry << '\n';
        log.flush();
    } else {
        std::cerr << "Error: Cannot write to log file: " << logFile.string() << std::endl;
    }
}

GraylogLogger::GraylogLogger(std::string host, int port, LogLevel threshold)
    : Logger(threshold), endpoint_("http://" + host + ":" + std::to_string(port) + "/gelf") {
    char hostName[256] = {};
    if (gethostname(hostName, sizeof(hostName) - 1) == 0 && hostName[0] != '\0') {
        source_ = hostName;
    } else {
        source_ = "localhost";
    }
}

std::string GraylogLogger::gelfPayload(LogLevel level, const std::string& message) const {
    Json::Value gelf;
    gelf["version"] = "1.1";
    gelf["host"] = source_;
    gelf["short_message"] = message;
    gelf["level"] = syslogSeverity(level);
    auto now = std::chrono::system_clock::now().time_since_epoch();
    gelf["timestamp"] = std::chrono::duration_cast<std::chrono::milliseconds>(now).count() / 1000.0;
    gelf["_application"] = "sftptransfer";
    gelf["_level_name"] = toString(level);

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, gelf);
}

void GraylogLogger::write(LogLevel level, const std::string& message) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        std::cerr << "Error: Failed to initialize CURL for Graylog" << std::endl;
        return;
    }

    std::string payload = gelfPayload(level, message);
    struct curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, endpoint_.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 5L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discardResponse);
    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        std::cerr << "Error: Failed to send log message to Graylog " << endpoint_ << ": "
                  << curl_easy_strerror(res) << std::endl;
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
}

std::unique_ptr<Logger> makeLogger(const LogSettings& settings) {
    LogLevel threshold = parseLogLevel(settings.level);
    if (settings.method == "graylog") {
        return std::make_unique<GraylogLogger>(settings.graylogHost, settings.graylogPort, threshold);
    }
    if (settings.method == "console") {
        return std::make_unique<ConsoleLogger>(threshold);
    }
    return std::make_unique<FileLogger>(settings.logDir, threshold);
}

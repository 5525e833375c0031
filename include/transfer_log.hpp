/**
 * @file transfer_log.hpp
 * @brief Logging sinks for SftpTransfer.
 *
 * The batch pipeline reports through the Logger interface only. Concrete sinks write to a
 * daily log file, to the console, or to a Graylog GELF HTTP input.
 *
 * @note The Graylog sink requires libcurl.
 */

#ifndef TRANSFER_LOG_HPP
#define TRANSFER_LOG_HPP

#include "transfer_config.hpp"
#include <filesystem>
#include <memory>
#include <string>

/**
 * @brief Log severities, ordered from most to least verbose.
 */
enum class LogLevel {
    Debug = 10,
    Info = 20,
    Warning = 30,
    Error = 40,
    Critical = 50
};

/**
 * @brief Parses a level name ("debug", "INFO", ...). Unknown names map to Info.
 */
LogLevel parseLogLevel(const std::string& name);

/**
 * @brief Returns the upper-case level name used in log lines (e.g. "WARNING").
 */
const char* toString(LogLevel level);

/**
 * @brief Interface for log sinks.
 *
 * Messages below the threshold are dropped before reaching the sink. Sinks never throw:
 * a failing sink reports to stderr and the run continues.
 */
class Logger {
public:
    /**
     * @brief Constructs a logger with the given threshold.
     */
    explicit Logger(LogLevel threshold = LogLevel::Info);

    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~Logger() = default;

    /**
     * @brief Forwards a message to the sink if it passes the threshold.
     */
    void log(LogLevel level, const std::string& message);

    void debug(const std::string& message) { log(LogLevel::Debug, message); }
    void info(const std::string& message) { log(LogLevel::Info, message); }
    void warning(const std::string& message) { log(LogLevel::Warning, message); }
    void error(const std::string& message) { log(LogLevel::Error, message); }
    void critical(const std::string& message) { log(LogLevel::Critical, message); }

    LogLevel threshold() const { return threshold_; }

protected:
    /**
     * @brief Delivers one message to the sink.
     *
     * @param level Message severity, already at or above the threshold.
     * @param message Message text.
     */
    virtual void write(LogLevel level, const std::string& message) = 0;

private:
    LogLevel threshold_;
};

/**
 * @brief Formats a log line: "YYYY-mm-dd HH:MM:SS LEVEL message".
 */
std::string formatLogLine(LogLevel level, const std::string& message);

/**
 * @brief Console sink. Warnings and above go to stderr, the rest to stdout.
 */
class ConsoleLogger : public Logger {
public:
    explicit ConsoleLogger(LogLevel threshold = LogLevel::Info);

protected:
    void write(LogLevel level, const std::string& message) override;
};

/**
 * @brief Daily log file sink.
 *
 * Appends to "<logDir>/sftptransfer_YYYY_MM_DD.log", creating logDir if needed, and echoes
 * every line to the console.
 */
class FileLogger : public Logger {
public:
    /**
     * @brief Constructs a file logger.
     *
     * @param logDir Directory for the daily log files.
     * @param threshold Minimum level written.
     */
    FileLogger(std::filesystem::path logDir, LogLevel threshold = LogLevel::Info);

    /**
     * @brief Returns the log file for today's date.
     */
    std::filesystem::path currentLogFile() const;

protected:
    void write(LogLevel level, const std::string& message) override;

private:
    std::filesystem::path logDir_; ///< Directory holding the daily files.
};

/**
 * @brief Graylog sink posting GELF 1.1 messages to a GELF HTTP input (not GELF UDP).
 *
 * Each message is sent to http://host:port/gelf with its syslog severity and the
 * "_application" field set to "sftptransfer".
 */
class GraylogLogger : public Logger {
public:
    /**
     * @brief Constructs a Graylog logger.
     *
     * @param host Graylog GELF HTTP input host.
     * @param port Graylog GELF HTTP input port (e.g. 12201).
     * @param threshold Minimum level sent.
     */
    GraylogLogger(std::string host, int port, LogLevel threshold = LogLevel::Info);

    /**
     * @brief Builds the GELF JSON document for a message.
     *
     * @return std::string Compact JSON payload.
     */
    std::string gelfPayload(LogLevel level, const std::string& message) const;

    /// URL messages are posted to.
    const std::string& endpoint() const { return endpoint_; }

protected:
    void write(LogLevel level, const std::string& message) override;

private:
    std::string endpoint_; ///< Full GELF HTTP input URL.
    std::string source_;   ///< Local host name reported as the GELF "host".
};

/**
 * @brief Creates the sink selected by the logging settings.
 *
 * @param settings Logging settings ("file", "console" or "graylog"; unknown methods fall back to file).
 * @return std::unique_ptr<Logger> The configured logger.
 */
std::unique_ptr<Logger> makeLogger(const LogSettings& settings);

#endif // TRANSFER_LOG_HPP

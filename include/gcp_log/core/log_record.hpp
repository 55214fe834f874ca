#ifndef GCP_LOG_LOG_RECORD_HPP
#define GCP_LOG_LOG_RECORD_HPP

#include "severity.hpp"
#include "timestamp.hpp"
#include <string>
#include <utility>

namespace gcplog {
    /// Level vocabulary of the calling logging facade.
    enum class LogLevel {
        TRACE,
        DEBUG,
        INFO,
        WARN,
        ERROR,
        FATAL
    };

    inline const char *getLevelString(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "TRACE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO";
            case LogLevel::WARN:  return "WARN";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            default: return "UNKNOWN";
        }
    }

    /// Map a facade level onto the Cloud Logging severity scale.
    /// TRACE has no counterpart and becomes Default.
    inline LogSeverity toSeverity(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return LogSeverity::Default;
            case LogLevel::DEBUG: return LogSeverity::Debug;
            case LogLevel::INFO:  return LogSeverity::Info;
            case LogLevel::WARN:  return LogSeverity::Warning;
            case LogLevel::ERROR: return LogSeverity::Error;
            case LogLevel::FATAL: return LogSeverity::Critical;
            default: return LogSeverity::Default;
        }
    }

    /// What a logging facade knows about one log statement.  Empty strings
    /// and a zero line mean "not captured".
    struct LogRecord {
        LogLevel level;
        std::string message;
        Timestamp timestamp;
        std::string target;
        std::string file;
        unsigned long line;
        std::string function;

        LogRecord() : level(LogLevel::INFO), timestamp(), line(0) {}

        LogRecord(LogLevel lvl, std::string msg, Timestamp time = std::chrono::system_clock::now())
            : level(lvl), message(std::move(msg)), timestamp(time), line(0) {}
    };
} // namespace gcplog

#endif // GCP_LOG_LOG_RECORD_HPP

#ifndef GCP_LOG_SEVERITY_HPP
#define GCP_LOG_SEVERITY_HPP

#include <stdexcept>
#include <string>

namespace gcplog {
    /// Severity levels recognized by the Cloud Logging agent, lowest first.
    enum class LogSeverity {
        Default,    ///< No assigned severity level.
        Debug,      ///< Debug or trace information.
        Info,       ///< Routine information such as ongoing status.
        Notice,     ///< Normal but significant events (start up, shut down).
        Warning,    ///< Events that might cause problems.
        Error,      ///< Events that are likely to cause problems.
        Critical,   ///< Events that cause more severe problems or outages.
        Alert,      ///< A person must take action immediately.
        Emergency   ///< One or more systems are unusable.
    };

    inline const char *getSeverityToken(LogSeverity severity) {
        switch (severity) {
            case LogSeverity::Default:   return "default";
            case LogSeverity::Debug:     return "debug";
            case LogSeverity::Info:      return "info";
            case LogSeverity::Notice:    return "notice";
            case LogSeverity::Warning:   return "warning";
            case LogSeverity::Error:     return "error";
            case LogSeverity::Critical:  return "critical";
            case LogSeverity::Alert:     return "alert";
            case LogSeverity::Emergency: return "emergency";
        }
        throw std::invalid_argument("Unknown log severity value");
    }

    /// Inverse of getSeverityToken().  Matching is case-sensitive.
    inline LogSeverity parseSeverity(const std::string &token) {
        if (token == "default")   return LogSeverity::Default;
        if (token == "debug")     return LogSeverity::Debug;
        if (token == "info")      return LogSeverity::Info;
        if (token == "notice")    return LogSeverity::Notice;
        if (token == "warning")   return LogSeverity::Warning;
        if (token == "error")     return LogSeverity::Error;
        if (token == "critical")  return LogSeverity::Critical;
        if (token == "alert")     return LogSeverity::Alert;
        if (token == "emergency") return LogSeverity::Emergency;
        throw std::invalid_argument("Unknown log severity: " + token);
    }

    inline bool isErrorOrAbove(LogSeverity severity) {
        return static_cast<int>(severity) >= static_cast<int>(LogSeverity::Error);
    }
} // namespace gcplog

#endif // GCP_LOG_SEVERITY_HPP

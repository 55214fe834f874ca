#ifndef GCP_LOG_JSON_KEYS_HPP
#define GCP_LOG_JSON_KEYS_HPP

namespace gcplog {
namespace keys {
    // Top-level LogEntry keys recognized by the Cloud Logging agent.
    static const char *const kSeverity       = "severity";
    static const char *const kMessage        = "message";
    static const char *const kReportType     = "@type";
    static const char *const kHttpRequest    = "httpRequest";
    static const char *const kTime           = "time";
    static const char *const kInsertId       = "logging.googleapis.com/insertId";
    static const char *const kLabels         = "logging.googleapis.com/labels";
    static const char *const kOperation      = "logging.googleapis.com/operation";
    static const char *const kSourceLocation = "logging.googleapis.com/sourceLocation";
    static const char *const kSpanId         = "logging.googleapis.com/spanId";
    static const char *const kTrace          = "logging.googleapis.com/trace";
    static const char *const kTraceSampled   = "logging.googleapis.com/trace_sampled";

    // Operation
    static const char *const kId       = "id";
    static const char *const kProducer = "producer";
    static const char *const kFirst    = "first";
    static const char *const kLast     = "last";

    // SourceLocation
    static const char *const kFile     = "file";
    static const char *const kLine     = "line";
    static const char *const kFunction = "function";

    // HttpRequest
    static const char *const kRequestMethod = "requestMethod";
    static const char *const kRequestUrl    = "requestUrl";
    static const char *const kRequestSize   = "requestSize";
    static const char *const kStatus        = "status";
    static const char *const kResponseSize  = "responseSize";
    static const char *const kUserAgent     = "userAgent";
    static const char *const kRemoteIp      = "remoteIp";
    static const char *const kServerIp      = "serverIp";
    static const char *const kLatency       = "latency";
    static const char *const kProtocol      = "protocol";
} // namespace keys
} // namespace gcplog

#endif // GCP_LOG_JSON_KEYS_HPP

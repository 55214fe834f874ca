#ifndef GCP_LOG_STRUCTURED_LOG_ENTRY_HPP
#define GCP_LOG_STRUCTURED_LOG_ENTRY_HPP

#include "http_request.hpp"
#include "operation.hpp"
#include "optional_field.hpp"
#include "severity.hpp"
#include "source_location.hpp"
#include "timestamp.hpp"
#include <map>
#include <string>

namespace gcplog {
    /// "@type" value that makes Error Reporting group an entry as an error
    /// event instead of treating it as a plain log line.
    static const char *const kErrorReportingType =
        "type.googleapis.com/google.devtools.clouderrorreporting.v1beta1.ReportedErrorEvent";

    /// One structured log record in the shape the Cloud Logging agent expects.
    ///
    /// Every field starts absent and only set fields are serialized.  Setters
    /// return *this so an entry can be built as "default + overrides":
    /// @code
    ///   StructuredLogEntry entry;
    ///   entry.setSeverity(LogSeverity::Warning).setMessage("careful");
    /// @endcode
    ///
    /// Severity and reportType are independent.  Setting "@type" on
    /// error-severity entries is a caller convention only.
    class StructuredLogEntry {
    public:
        using Labels = std::map<std::string, std::string>;

        bool hasSeverity() const { return m_severity.has(); }
        LogSeverity severity() const { return m_severity.get(); }
        StructuredLogEntry &setSeverity(LogSeverity severity) {
            m_severity.set(severity);
            return *this;
        }
        void clearSeverity() { m_severity.reset(); }

        /// The line shown in the Logs Explorer.  May carry a backtrace, see
        /// formatMessageWithBacktrace().
        bool hasMessage() const { return m_message.has(); }
        const std::string &message() const { return m_message.get(); }
        StructuredLogEntry &setMessage(std::string message) {
            m_message.set(std::move(message));
            return *this;
        }
        void clearMessage() { m_message.reset(); }

        bool hasReportType() const { return m_reportType.has(); }
        const std::string &reportType() const { return m_reportType.get(); }
        StructuredLogEntry &setReportType(std::string reportType) {
            m_reportType.set(std::move(reportType));
            return *this;
        }
        StructuredLogEntry &reportAsError() {
            m_reportType.set(kErrorReportingType);
            return *this;
        }
        void clearReportType() { m_reportType.reset(); }

        bool hasHttpRequest() const { return m_httpRequest.has(); }
        const HttpRequest &httpRequest() const { return m_httpRequest.get(); }
        HttpRequest &mutableHttpRequest() { return m_httpRequest.mutableValue(); }
        StructuredLogEntry &setHttpRequest(HttpRequest request) {
            m_httpRequest.set(std::move(request));
            return *this;
        }
        void clearHttpRequest() { m_httpRequest.reset(); }

        bool hasTime() const { return m_time.has(); }
        const Timestamp &time() const { return m_time.get(); }
        StructuredLogEntry &setTime(Timestamp time) {
            m_time.set(time);
            return *this;
        }
        StructuredLogEntry &setTimeNow() {
            m_time.set(std::chrono::system_clock::now());
            return *this;
        }
        void clearTime() { m_time.reset(); }

        /// Entries with the same timestamp and insertId are de-duplicated
        /// within a single query result.
        bool hasInsertId() const { return m_insertId.has(); }
        const std::string &insertId() const { return m_insertId.get(); }
        StructuredLogEntry &setInsertId(std::string insertId) {
            m_insertId.set(std::move(insertId));
            return *this;
        }
        void clearInsertId() { m_insertId.reset(); }

        // Labels are serialized only when at least one is present.
        const Labels &labels() const { return m_labels; }
        StructuredLogEntry &addLabel(std::string key, std::string value) {
            m_labels[std::move(key)] = std::move(value);
            return *this;
        }
        StructuredLogEntry &setLabels(Labels labels) {
            m_labels = std::move(labels);
            return *this;
        }
        void clearLabels() { m_labels.clear(); }

        bool hasOperation() const { return m_operation.has(); }
        const Operation &operation() const { return m_operation.get(); }
        Operation &mutableOperation() { return m_operation.mutableValue(); }
        StructuredLogEntry &setOperation(Operation operation) {
            m_operation.set(std::move(operation));
            return *this;
        }
        void clearOperation() { m_operation.reset(); }

        bool hasSourceLocation() const { return m_sourceLocation.has(); }
        const SourceLocation &sourceLocation() const { return m_sourceLocation.get(); }
        SourceLocation &mutableSourceLocation() { return m_sourceLocation.mutableValue(); }
        StructuredLogEntry &setSourceLocation(SourceLocation location) {
            m_sourceLocation.set(std::move(location));
            return *this;
        }
        void clearSourceLocation() { m_sourceLocation.reset(); }

        /// 16-character hex span id, e.g. "000000000000004a".
        bool hasSpanId() const { return m_spanId.has(); }
        const std::string &spanId() const { return m_spanId.get(); }
        StructuredLogEntry &setSpanId(std::string spanId) {
            m_spanId.set(std::move(spanId));
            return *this;
        }
        void clearSpanId() { m_spanId.reset(); }

        /// Trace resource name, e.g. "projects/my-projectid/traces/06796866738c859f2f19b7cfb3214824".
        bool hasTrace() const { return m_trace.has(); }
        const std::string &trace() const { return m_trace.get(); }
        StructuredLogEntry &setTrace(std::string trace) {
            m_trace.set(std::move(trace));
            return *this;
        }
        void clearTrace() { m_trace.reset(); }

        bool hasTraceSampled() const { return m_traceSampled.has(); }
        bool traceSampled() const { return m_traceSampled.get(); }
        StructuredLogEntry &setTraceSampled(bool sampled) {
            m_traceSampled.set(sampled);
            return *this;
        }
        void clearTraceSampled() { m_traceSampled.reset(); }

        bool operator==(const StructuredLogEntry &other) const {
            return m_severity == other.m_severity
                   && m_message == other.m_message
                   && m_reportType == other.m_reportType
                   && m_httpRequest == other.m_httpRequest
                   && m_time == other.m_time
                   && m_insertId == other.m_insertId
                   && m_labels == other.m_labels
                   && m_operation == other.m_operation
                   && m_sourceLocation == other.m_sourceLocation
                   && m_spanId == other.m_spanId
                   && m_trace == other.m_trace
                   && m_traceSampled == other.m_traceSampled;
        }

        bool operator!=(const StructuredLogEntry &other) const { return !(*this == other); }

    private:
        detail::OptionalField<LogSeverity> m_severity;
        detail::OptionalField<std::string> m_message;
        detail::OptionalField<std::string> m_reportType;
        detail::OptionalField<HttpRequest> m_httpRequest;
        detail::OptionalField<Timestamp> m_time;
        detail::OptionalField<std::string> m_insertId;
        Labels m_labels;
        detail::OptionalField<Operation> m_operation;
        detail::OptionalField<SourceLocation> m_sourceLocation;
        detail::OptionalField<std::string> m_spanId;
        detail::OptionalField<std::string> m_trace;
        detail::OptionalField<bool> m_traceSampled;
    };
} // namespace gcplog

#endif // GCP_LOG_STRUCTURED_LOG_ENTRY_HPP

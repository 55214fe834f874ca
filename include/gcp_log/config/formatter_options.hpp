#ifndef GCP_LOG_FORMATTER_OPTIONS_HPP
#define GCP_LOG_FORMATTER_OPTIONS_HPP

#include <cstdlib>
#include <string>
#include <utility>

namespace gcplog {
    enum class LogFormat {
        Text,
        Json
    };

    /// "json" selects structured output; anything else falls back to text.
    inline LogFormat parseLogFormat(const std::string &name) {
        return name == "json" ? LogFormat::Json : LogFormat::Text;
    }

    /// Read the output format from an environment variable (LOG_FORMAT by
    /// default).  Unset means text.
    inline LogFormat logFormatFromEnvironment(const char *variable = "LOG_FORMAT") {
        const char *value = std::getenv(variable);
        if (!value) return LogFormat::Text;
        return parseLogFormat(value);
    }

    /// Settings applied by StructuredFormatter to every record.
    ///
    /// Usage:
    /// @code
    ///   FormatterOptions options;
    ///   options.operationId("My Service")
    ///          .operationProducer("MyService.Backend")
    ///          .reportErrors(true);
    /// @endcode
    class FormatterOptions {
    public:
        FormatterOptions()
            : m_includeSourceLocation(true)
            , m_reportErrors(true) {}

        FormatterOptions &operationId(std::string id) {
            m_operationId = std::move(id);
            return *this;
        }

        FormatterOptions &operationProducer(std::string producer) {
            m_operationProducer = std::move(producer);
            return *this;
        }

        FormatterOptions &includeSourceLocation(bool enable) {
            m_includeSourceLocation = enable;
            return *this;
        }

        /// Tag Error-and-above entries with the Error Reporting "@type".
        FormatterOptions &reportErrors(bool enable) {
            m_reportErrors = enable;
            return *this;
        }

        const std::string &getOperationId() const { return m_operationId; }
        const std::string &getOperationProducer() const { return m_operationProducer; }
        bool isSourceLocationIncluded() const { return m_includeSourceLocation; }
        bool isErrorReportingEnabled() const { return m_reportErrors; }

    private:
        std::string m_operationId;
        std::string m_operationProducer;
        bool m_includeSourceLocation;
        bool m_reportErrors;
    };
} // namespace gcplog

#endif // GCP_LOG_FORMATTER_OPTIONS_HPP

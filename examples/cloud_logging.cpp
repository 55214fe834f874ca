#include "gcp_log.hpp"
#include <memory>
#include <string>
#include <vector>

// A minimal facade in front of gcp_log: pick the output format from
// LOG_FORMAT (json or text), format each record and write it to stdout.
// Run with LOG_FORMAT=json to get lines the Cloud Logging agent ingests.

namespace {
    std::vector<gcplog::StackFrame> exampleBacktrace() {
        return {
            gcplog::StackFrame("services::module_name::he77c0bac773c93b4", 42),
            gcplog::StackFrame("services::module_name::h7ad5e699ac5d6658")
        };
    }

    class ExampleLogger {
    public:
        ExampleLogger()
            : m_transport(gcplog::detail::make_unique<gcplog::StdoutTransport>()) {
            gcplog::FormatterOptions options;
            options.operationId("My Service").operationProducer("MyService.Backend");
            m_formatter = gcplog::makeFormatter(gcplog::logFormatFromEnvironment(), options);
        }

        void write(gcplog::LogRecord record) {
            if (record.level == gcplog::LogLevel::WARN || record.level == gcplog::LogLevel::ERROR) {
                record.message = gcplog::formatMessageWithBacktrace(record.message, exampleBacktrace());
            }
            m_transport->write(m_formatter->format(record));
        }

    private:
        std::unique_ptr<gcplog::IFormatter> m_formatter;
        std::unique_ptr<gcplog::ITransport> m_transport;
    };
} // namespace

int main() {
    ExampleLogger logger;

    logger.write(GCP_LOG_RECORD(gcplog::LogLevel::INFO, "cloud_logging", "Start logging"));
    logger.write(GCP_LOG_RECORD(gcplog::LogLevel::WARN, "cloud_logging", "Oh no, things might go wrong soon."));
    logger.write(GCP_LOG_RECORD(gcplog::LogLevel::ERROR, "cloud_logging", "Yeah, this is not good."));
    logger.write(GCP_LOG_RECORD(gcplog::LogLevel::TRACE, "cloud_logging", "Something went wrong in `my service`."));

    // Entries can also be built by hand, e.g. for a request log line.
    gcplog::StructuredLogEntry request;
    request.setSeverity(gcplog::LogSeverity::Notice)
           .setMessage("GET /api/users")
           .setTimeNow()
           .setTrace("projects/my-projectid/traces/06796866738c859f2f19b7cfb3214824")
           .setSourceLocation(GCP_LOG_SOURCE_LOCATION());
    request.mutableHttpRequest()
           .setRequestMethod(gcplog::HttpMethod::Get)
           .setRequestUrl("https://example.com/api/users")
           .setStatus(200)
           .setLatency("0.012s");

    gcplog::StdoutTransport stdoutTransport;
    gcplog::writeEntry(stdoutTransport, request);
    return 0;
}

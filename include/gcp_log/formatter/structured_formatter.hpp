#ifndef GCP_LOG_STRUCTURED_FORMATTER_HPP
#define GCP_LOG_STRUCTURED_FORMATTER_HPP

#include "formatter_interface.hpp"
#include "../config/formatter_options.hpp"
#include "../core/structured_log_entry.hpp"
#include "../serialization/json_codec.hpp"
#include <string>
#include <utility>

namespace gcplog {
    /// Turns facade records into Cloud Logging JSON lines.
    class StructuredFormatter : public IFormatter {
    public:
        StructuredFormatter() {}

        explicit StructuredFormatter(FormatterOptions options)
            : m_options(std::move(options)) {}

        const FormatterOptions &options() const { return m_options; }

        StructuredLogEntry buildEntry(const LogRecord &record) const {
            StructuredLogEntry entry;
            LogSeverity severity = toSeverity(record.level);
            entry.setSeverity(severity)
                 .setMessage(record.message)
                 .setTime(record.timestamp);

            if (m_options.isErrorReportingEnabled() && isErrorOrAbove(severity)) {
                entry.reportAsError();
            }

            if (!m_options.getOperationId().empty() || !m_options.getOperationProducer().empty()) {
                Operation &operation = entry.mutableOperation();
                if (!m_options.getOperationId().empty()) {
                    operation.setId(m_options.getOperationId());
                }
                if (!m_options.getOperationProducer().empty()) {
                    operation.setProducer(m_options.getOperationProducer());
                }
            }

            if (m_options.isSourceLocationIncluded()) {
                SourceLocation location;
                if (!record.file.empty()) location.setFile(record.file);
                if (record.line != 0) location.setLineNumber(record.line);
                if (!record.function.empty()) {
                    location.setFunction(record.function);
                } else if (!record.target.empty()) {
                    location.setFunction(record.target);
                }
                if (!location.empty()) {
                    entry.setSourceLocation(std::move(location));
                }
            }
            return entry;
        }

        /// @throws EncodingError if the record holds invalid UTF-8.
        std::string format(const LogRecord &record) const override {
            return toJsonLine(buildEntry(record));
        }

    private:
        FormatterOptions m_options;
    };
} // namespace gcplog

#endif // GCP_LOG_STRUCTURED_FORMATTER_HPP

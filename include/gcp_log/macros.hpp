#ifndef GCP_LOG_MACROS_HPP
#define GCP_LOG_MACROS_HPP

#include "core/log_record.hpp"
#include "core/source_location.hpp"
#include <string>

#ifndef GCP_LOG_NO_MACROS

// SourceLocation for the line the macro is expanded on.
#define GCP_LOG_SOURCE_LOCATION() \
    ::gcplog::SourceLocation::fromCallSite(__FILE__, __LINE__, __func__)

// LogRecord stamped with the call site and the current time.
#define GCP_LOG_RECORD(level, target, message) \
    ::gcplog::detail::makeRecord((level), (target), (message), \
                                 __FILE__, __LINE__, __func__)

namespace gcplog {
namespace detail {
    inline LogRecord makeRecord(LogLevel level, const std::string &target, const std::string &message,
                                const char *file, unsigned long line, const char *function) {
        LogRecord record(level, message);
        record.target = target;
        record.file = file ? file : "";
        record.line = line;
        record.function = function ? function : "";
        return record;
    }
} // namespace detail
} // namespace gcplog

#endif // GCP_LOG_NO_MACROS

#endif // GCP_LOG_MACROS_HPP

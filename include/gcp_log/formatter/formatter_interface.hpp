#ifndef GCP_LOG_FORMATTER_INTERFACE_HPP
#define GCP_LOG_FORMATTER_INTERFACE_HPP

#include "../core/log_record.hpp"
#include <string>

namespace gcplog {
    class IFormatter {
    public:
        virtual ~IFormatter() = default;

        /// Render one record as one line, without the trailing newline.
        virtual std::string format(const LogRecord &record) const = 0;
    };
} // namespace gcplog

#endif // GCP_LOG_FORMATTER_INTERFACE_HPP

#ifndef GCP_LOG_TEXT_FORMATTER_HPP
#define GCP_LOG_TEXT_FORMATTER_HPP

#include "formatter_interface.hpp"
#include <iomanip>
#include <sstream>

namespace gcplog {
    /// Plain console rendering for local development: "WARN :app::db - message".
    class TextFormatter : public IFormatter {
    public:
        std::string format(const LogRecord &record) const override {
            std::ostringstream oss;
            oss << std::left << std::setw(5) << getLevelString(record.level)
                << ':' << record.target << " - " << record.message;
            return oss.str();
        }
    };
} // namespace gcplog

#endif // GCP_LOG_TEXT_FORMATTER_HPP

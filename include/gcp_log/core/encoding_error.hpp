#ifndef GCP_LOG_ENCODING_ERROR_HPP
#define GCP_LOG_ENCODING_ERROR_HPP

#include <stdexcept>
#include <string>

namespace gcplog {
    /// Thrown when an entry cannot be rendered as JSON (for example a text
    /// field holding invalid UTF-8).  Nothing is retried and nothing is
    /// logged; the caller decides what to do with the entry.
    class EncodingError : public std::runtime_error {
    public:
        explicit EncodingError(const std::string &what)
            : std::runtime_error("gcp_log: encoding failure: " + what) {}
    };
} // namespace gcplog

#endif // GCP_LOG_ENCODING_ERROR_HPP

#ifndef GCP_LOG_TRANSPORT_INTERFACE_HPP
#define GCP_LOG_TRANSPORT_INTERFACE_HPP

#include <string>

namespace gcplog {

    /// Destination for serialized entries.  Each write() emits exactly one
    /// line: the given text followed by '\n'.
    class ITransport {
    public:
        virtual ~ITransport() = default;
        virtual void write(const std::string &line) = 0;
    };

} // namespace gcplog

#endif // GCP_LOG_TRANSPORT_INTERFACE_HPP

#ifndef GCP_LOG_WRITE_ENTRY_HPP
#define GCP_LOG_WRITE_ENTRY_HPP

#include "transport_interface.hpp"
#include "../core/structured_log_entry.hpp"
#include "../serialization/json_codec.hpp"

namespace gcplog {
    /// Serialize one entry and emit it as one line.  Nothing is written if
    /// serialization fails.
    ///
    /// @throws EncodingError, see toJsonLine().
    inline void writeEntry(ITransport &transport, const StructuredLogEntry &entry) {
        transport.write(toJsonLine(entry));
    }
} // namespace gcplog

#endif // GCP_LOG_WRITE_ENTRY_HPP

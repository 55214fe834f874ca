#include "gcp_log.hpp"
#include <cstdlib>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

// Route uncaught exceptions through the same one-object-per-line JSON as
// normal log output, so Error Reporting picks up crashes too.

namespace {
    void reportCrashAndAbort() {
        gcplog::StderrTransport transport;
        std::vector<gcplog::StackFrame> frames = gcplog::captureStackFrames(32, 2);
        gcplog::StructuredLogEntry entry;

        std::exception_ptr current = std::current_exception();
        if (current) {
            try {
                std::rethrow_exception(current);
            } catch (const std::exception &ex) {
                entry = gcplog::makeCrashEntry(ex, frames);
            } catch (...) {
                entry = gcplog::makeCrashEntry("terminate called with a non-standard exception", frames);
            }
        } else {
            entry = gcplog::makeCrashEntry("terminate called without an active exception", frames);
        }

        try {
            gcplog::writeEntry(transport, entry);
        } catch (const gcplog::EncodingError &) {
            // Demangled names can carry bytes that are not UTF-8.
            entry.setMessage("crash report could not be encoded");
            entry.clearLabels();
            gcplog::writeEntry(transport, entry);
        }
        std::abort();
    }

    void loadConfiguration() {
        try {
            throw std::invalid_argument("missing key 'port'");
        } catch (...) {
            std::throw_with_nested(std::runtime_error("startup failed"));
        }
    }
} // namespace

int main() {
    std::set_terminate(reportCrashAndAbort);
    loadConfiguration();
    return 0;
}

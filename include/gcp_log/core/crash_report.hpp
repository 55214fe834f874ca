#ifndef GCP_LOG_CRASH_REPORT_HPP
#define GCP_LOG_CRASH_REPORT_HPP

#include "structured_log_entry.hpp"
#include <cstdlib>
#include <exception>
#include <string>
#include <typeinfo>
#include <utility>
#include <vector>

#if defined(__GNUC__) || defined(__clang__)
#include <cxxabi.h>
#endif

#if defined(__GLIBC__)
#include <execinfo.h>
#endif

namespace gcplog {
    struct StackFrame {
        std::string function;
        unsigned long line;  ///< 0 when unknown.

        StackFrame() : line(0) {}

        StackFrame(std::string fn, unsigned long ln = 0)
            : function(std::move(fn)), line(ln) {}
    };

    /// Append a backtrace to a message in the layout Error Reporting parses:
    /// @code
    ///   My normal log message goes here:
    ///      at services::module_name::he77c0bac773c93b4 line: 42
    ///      at services::module_name::h7ad5e699ac5d6658
    /// @endcode
    /// With no frames the message is returned unchanged.
    inline std::string formatMessageWithBacktrace(const std::string &message,
                                                  const std::vector<StackFrame> &frames) {
        if (frames.empty()) return message;

        std::string result = message;
        if (result.empty() || result[result.size() - 1] != ':') {
            result += ':';
        }
        for (const auto &frame : frames) {
            result += "\n   at ";
            result += frame.function;
            if (frame.line != 0) {
                result += " line: ";
                result += std::to_string(frame.line);
            }
        }
        return result;
    }

    namespace detail {
        inline std::string demangle(const char *mangledName) {
            if (!mangledName) return "unknown";
#if defined(__GNUC__) || defined(__clang__)
            int status = 0;
            char *demangled = abi::__cxa_demangle(mangledName, nullptr, nullptr, &status);
            if (status == 0 && demangled) {
                std::string result(demangled);
                std::free(demangled);
                return result;
            }
            std::free(demangled);
#endif
            return std::string(mangledName);
        }

        // "./app(_ZN3app4mainEv+0x1a) [0x400b2d]" -> "app::main()"
        inline std::string functionFromSymbol(const std::string &symbol) {
            size_t open = symbol.find('(');
            size_t plus = symbol.find('+', open == std::string::npos ? 0 : open);
            if (open == std::string::npos || plus == std::string::npos || plus == open + 1) {
                return symbol;
            }
            return demangle(symbol.substr(open + 1, plus - open - 1).c_str());
        }

        // Bounded so a self-referencing nested chain cannot recurse forever.
        static constexpr int kMaxNestedExceptionDepth = 20;

        inline void collectNestedChain(const std::exception &ex, std::string &chain, int depth) {
            if (depth >= kMaxNestedExceptionDepth) return;
            try {
                std::rethrow_if_nested(ex);
            } catch (const std::exception &nested) {
                if (!chain.empty()) chain += '\n';
                chain += demangle(typeid(nested).name());
                chain += ": ";
                chain += nested.what() ? nested.what() : "(no message)";
                collectNestedChain(nested, chain, depth + 1);
            } catch (...) {
                if (!chain.empty()) chain += '\n';
                chain += "unknown exception";
            }
        }
    } // namespace detail

    /// Best-effort capture of the calling thread's stack, innermost first.
    /// Line numbers are not available.  Returns an empty list on platforms
    /// without glibc's backtrace().
    inline std::vector<StackFrame> captureStackFrames(size_t maxFrames = 32, size_t skip = 1) {
        std::vector<StackFrame> frames;
#if defined(__GLIBC__)
        std::vector<void *> addresses(maxFrames + skip);
        int count = ::backtrace(addresses.data(), static_cast<int>(addresses.size()));
        if (count <= 0) return frames;
        char **symbols = ::backtrace_symbols(addresses.data(), count);
        if (!symbols) return frames;
        for (int i = static_cast<int>(skip); i < count && frames.size() < maxFrames; ++i) {
            frames.push_back(StackFrame(detail::functionFromSymbol(symbols[i])));
        }
        std::free(symbols);
#else
        (void) maxFrames;
        (void) skip;
#endif
        return frames;
    }

    /// Label key under which makeCrashEntry() records nested exceptions.
    static const char *const kCausedByLabel = "caused_by";

    /// Critical, error-reported entry for a crash with a free-form message.
    inline StructuredLogEntry makeCrashEntry(const std::string &message,
                                             const std::vector<StackFrame> &frames = std::vector<StackFrame>()) {
        StructuredLogEntry entry;
        entry.setSeverity(LogSeverity::Critical)
             .setMessage(formatMessageWithBacktrace(message, frames))
             .reportAsError()
             .setTimeNow();
        return entry;
    }

    /// Crash entry for an exception.  The message is "<type>: <what()>";
    /// any std::nested_exception chain goes into the caused_by label.
    inline StructuredLogEntry makeCrashEntry(const std::exception &ex,
                                             const std::vector<StackFrame> &frames = std::vector<StackFrame>()) {
        std::string header = detail::demangle(typeid(ex).name());
        header += ": ";
        header += ex.what() ? ex.what() : "(no message)";

        StructuredLogEntry entry = makeCrashEntry(header, frames);

        std::string chain;
        detail::collectNestedChain(ex, chain, 0);
        if (!chain.empty()) {
            entry.addLabel(kCausedByLabel, chain);
        }
        return entry;
    }
} // namespace gcplog

#endif // GCP_LOG_CRASH_REPORT_HPP

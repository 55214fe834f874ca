#ifndef GCP_LOG_STREAM_TRANSPORT_HPP
#define GCP_LOG_STREAM_TRANSPORT_HPP

#include "transport_interface.hpp"
#include <iostream>
#include <mutex>
#include <ostream>

namespace gcplog {
    /// Writes lines to a caller-owned stream.  The stream must outlive the
    /// transport.
    class StreamTransport : public ITransport {
    public:
        explicit StreamTransport(std::ostream &stream) : m_stream(stream) {}

        void write(const std::string &line) override {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stream << line << '\n' << std::flush;
        }

    private:
        std::ostream &m_stream;
        std::mutex m_mutex;
    };

    /// @note All StdoutTransport instances share one mutex so concurrent
    ///       lines never interleave.  StderrTransport has its own.
    class StdoutTransport : public ITransport {
    public:
        void write(const std::string &line) override {
            std::lock_guard<std::mutex> lock(sharedMutex());
            // The ingestion agent reads stdout line by line; flush each entry.
            std::cout << line << '\n' << std::flush;
        }

    private:
        static std::mutex &sharedMutex() {
            static std::mutex s_mutex;
            return s_mutex;
        }
    };

    class StderrTransport : public ITransport {
    public:
        void write(const std::string &line) override {
            std::lock_guard<std::mutex> lock(sharedMutex());
            std::cerr << line << '\n' << std::flush;
        }

    private:
        static std::mutex &sharedMutex() {
            static std::mutex s_mutex;
            return s_mutex;
        }
    };
} // namespace gcplog

#endif // GCP_LOG_STREAM_TRANSPORT_HPP

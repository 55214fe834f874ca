#ifndef GCP_LOG_FILE_TRANSPORT_HPP
#define GCP_LOG_FILE_TRANSPORT_HPP

#include "transport_interface.hpp"
#include <fstream>
#include <mutex>
#include <stdexcept>

namespace gcplog {
    /// Appends one line per write to a file, e.g. a path tailed by a
    /// log-shipping agent.
    class FileTransport : public ITransport {
    public:
        /// @throws std::runtime_error if the file cannot be opened for appending.
        explicit FileTransport(const std::string &filename) : m_filename(filename) {
            m_file.open(filename, std::ios::out | std::ios::app);
            if (!m_file.is_open()) {
                throw std::runtime_error("FileTransport: cannot open " + filename);
            }
        }

        void write(const std::string &line) override {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_file << line << '\n';
            m_file.flush();
        }

        const std::string &filename() const { return m_filename; }

    private:
        std::string m_filename;
        std::ofstream m_file;
        std::mutex m_mutex;
    };
} // namespace gcplog

#endif // GCP_LOG_FILE_TRANSPORT_HPP

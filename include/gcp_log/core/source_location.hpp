#ifndef GCP_LOG_SOURCE_LOCATION_HPP
#define GCP_LOG_SOURCE_LOCATION_HPP

#include "optional_field.hpp"
#include <string>

namespace gcplog {
    /// Where in the caller's code a log statement was issued.
    class SourceLocation {
    public:
        /// Build a location from the values of __FILE__, __LINE__ and
        /// __func__.  Null pointers and a zero line are left absent.
        static SourceLocation fromCallSite(const char *file, unsigned long line, const char *function) {
            SourceLocation location;
            if (file) location.setFile(file);
            if (line != 0) location.setLineNumber(line);
            if (function) location.setFunction(function);
            return location;
        }

        bool hasFile() const { return m_file.has(); }
        const std::string &file() const { return m_file.get(); }
        SourceLocation &setFile(std::string file) {
            m_file.set(std::move(file));
            return *this;
        }
        void clearFile() { m_file.reset(); }

        // The schema carries the line as a string, not a number.
        bool hasLine() const { return m_line.has(); }
        const std::string &line() const { return m_line.get(); }
        SourceLocation &setLine(std::string line) {
            m_line.set(std::move(line));
            return *this;
        }
        SourceLocation &setLineNumber(unsigned long line) {
            m_line.set(std::to_string(line));
            return *this;
        }
        void clearLine() { m_line.reset(); }

        bool hasFunction() const { return m_function.has(); }
        const std::string &function() const { return m_function.get(); }
        SourceLocation &setFunction(std::string function) {
            m_function.set(std::move(function));
            return *this;
        }
        void clearFunction() { m_function.reset(); }

        bool empty() const { return !m_file.has() && !m_line.has() && !m_function.has(); }

        bool operator==(const SourceLocation &other) const {
            return m_file == other.m_file && m_line == other.m_line && m_function == other.m_function;
        }

        bool operator!=(const SourceLocation &other) const { return !(*this == other); }

    private:
        detail::OptionalField<std::string> m_file;
        detail::OptionalField<std::string> m_line;
        detail::OptionalField<std::string> m_function;
    };
} // namespace gcplog

#endif // GCP_LOG_SOURCE_LOCATION_HPP

#pragma once
#include "gcp_log/transport/transport_interface.hpp"
#include <cstddef>

namespace gcplog {

class NullTransport : public ITransport {
public:
    void write(const std::string &line) override { m_bytes += line.size() + 1; }
    std::size_t bytes() const { return m_bytes; }

private:
    std::size_t m_bytes = 0;
};

} // namespace gcplog

#ifndef GCP_LOG_HTTP_REQUEST_HPP
#define GCP_LOG_HTTP_REQUEST_HPP

#include "optional_field.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>

namespace gcplog {
    enum class HttpMethod {
        Get,
        Head,
        Put,
        Post
    };

    inline const char *getHttpMethodToken(HttpMethod method) {
        switch (method) {
            case HttpMethod::Get:  return "get";
            case HttpMethod::Head: return "head";
            case HttpMethod::Put:  return "put";
            case HttpMethod::Post: return "post";
        }
        throw std::invalid_argument("Unknown HTTP method value");
    }

    inline HttpMethod parseHttpMethod(const std::string &token) {
        if (token == "get")  return HttpMethod::Get;
        if (token == "head") return HttpMethod::Head;
        if (token == "put")  return HttpMethod::Put;
        if (token == "post") return HttpMethod::Post;
        throw std::invalid_argument("Unknown HTTP method: " + token);
    }

    /// Subset of the LogEntry HttpRequest record.  Sizes and latency are
    /// text because the schema encodes them as strings; status is a number.
    class HttpRequest {
    public:
        bool hasRequestMethod() const { return m_requestMethod.has(); }
        HttpMethod requestMethod() const { return m_requestMethod.get(); }
        HttpRequest &setRequestMethod(HttpMethod method) {
            m_requestMethod.set(method);
            return *this;
        }
        void clearRequestMethod() { m_requestMethod.reset(); }

        /// Scheme, host, path and query, e.g. "http://example.com/some/info?color=red".
        bool hasRequestUrl() const { return m_requestUrl.has(); }
        const std::string &requestUrl() const { return m_requestUrl.get(); }
        HttpRequest &setRequestUrl(std::string url) {
            m_requestUrl.set(std::move(url));
            return *this;
        }
        void clearRequestUrl() { m_requestUrl.reset(); }

        bool hasRequestSize() const { return m_requestSize.has(); }
        const std::string &requestSize() const { return m_requestSize.get(); }
        HttpRequest &setRequestSize(std::string size) {
            m_requestSize.set(std::move(size));
            return *this;
        }
        void clearRequestSize() { m_requestSize.reset(); }

        bool hasStatus() const { return m_status.has(); }
        std::uint16_t status() const { return m_status.get(); }
        HttpRequest &setStatus(std::uint16_t status) {
            m_status.set(status);
            return *this;
        }
        void clearStatus() { m_status.reset(); }

        bool hasResponseSize() const { return m_responseSize.has(); }
        const std::string &responseSize() const { return m_responseSize.get(); }
        HttpRequest &setResponseSize(std::string size) {
            m_responseSize.set(std::move(size));
            return *this;
        }
        void clearResponseSize() { m_responseSize.reset(); }

        bool hasUserAgent() const { return m_userAgent.has(); }
        const std::string &userAgent() const { return m_userAgent.get(); }
        HttpRequest &setUserAgent(std::string agent) {
            m_userAgent.set(std::move(agent));
            return *this;
        }
        void clearUserAgent() { m_userAgent.reset(); }

        /// IPv4 or IPv6 address of the client, optionally with a port.
        bool hasRemoteIp() const { return m_remoteIp.has(); }
        const std::string &remoteIp() const { return m_remoteIp.get(); }
        HttpRequest &setRemoteIp(std::string ip) {
            m_remoteIp.set(std::move(ip));
            return *this;
        }
        void clearRemoteIp() { m_remoteIp.reset(); }

        bool hasServerIp() const { return m_serverIp.has(); }
        const std::string &serverIp() const { return m_serverIp.get(); }
        HttpRequest &setServerIp(std::string ip) {
            m_serverIp.set(std::move(ip));
            return *this;
        }
        void clearServerIp() { m_serverIp.reset(); }

        /// Seconds with up to nine fractional digits and an 's' suffix, e.g. "3.5s".
        bool hasLatency() const { return m_latency.has(); }
        const std::string &latency() const { return m_latency.get(); }
        HttpRequest &setLatency(std::string latency) {
            m_latency.set(std::move(latency));
            return *this;
        }
        void clearLatency() { m_latency.reset(); }

        bool hasProtocol() const { return m_protocol.has(); }
        const std::string &protocol() const { return m_protocol.get(); }
        HttpRequest &setProtocol(std::string protocol) {
            m_protocol.set(std::move(protocol));
            return *this;
        }
        void clearProtocol() { m_protocol.reset(); }

        bool empty() const {
            return !m_requestMethod.has() && !m_requestUrl.has() && !m_requestSize.has()
                   && !m_status.has() && !m_responseSize.has() && !m_userAgent.has()
                   && !m_remoteIp.has() && !m_serverIp.has() && !m_latency.has()
                   && !m_protocol.has();
        }

        bool operator==(const HttpRequest &other) const {
            return m_requestMethod == other.m_requestMethod
                   && m_requestUrl == other.m_requestUrl
                   && m_requestSize == other.m_requestSize
                   && m_status == other.m_status
                   && m_responseSize == other.m_responseSize
                   && m_userAgent == other.m_userAgent
                   && m_remoteIp == other.m_remoteIp
                   && m_serverIp == other.m_serverIp
                   && m_latency == other.m_latency
                   && m_protocol == other.m_protocol;
        }

        bool operator!=(const HttpRequest &other) const { return !(*this == other); }

    private:
        detail::OptionalField<HttpMethod> m_requestMethod;
        detail::OptionalField<std::string> m_requestUrl;
        detail::OptionalField<std::string> m_requestSize;
        detail::OptionalField<std::uint16_t> m_status;
        detail::OptionalField<std::string> m_responseSize;
        detail::OptionalField<std::string> m_userAgent;
        detail::OptionalField<std::string> m_remoteIp;
        detail::OptionalField<std::string> m_serverIp;
        detail::OptionalField<std::string> m_latency;
        detail::OptionalField<std::string> m_protocol;
    };
} // namespace gcplog

#endif // GCP_LOG_HTTP_REQUEST_HPP

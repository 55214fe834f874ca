#ifndef GCP_LOG_JSON_CODEC_HPP
#define GCP_LOG_JSON_CODEC_HPP

#include "json_keys.hpp"
#include "../core/encoding_error.hpp"
#include "../core/structured_log_entry.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>

// JSON mapping for the structured logging types.
//
// to_json/from_json are found by nlohmann's ADL lookup, so
// `nlohmann::json j = entry;` and `j.get<StructuredLogEntry>()` work with
// both nlohmann::json and nlohmann::ordered_json.  Absent fields are never
// written; on the way back in, a missing key and an explicit null both mean
// "absent".

namespace gcplog {
    using Json = nlohmann::ordered_json;

    namespace detail {
        template<typename T, typename BasicJsonType>
        bool readMember(const BasicJsonType &j, const char *key, T &out) {
            auto it = j.find(key);
            if (it == j.end() || it->is_null()) {
                return false;
            }
            out = it->template get<T>();
            return true;
        }

        // HTTP status codes are non-negative integers that fit in 16 bits;
        // get<std::uint16_t>() would truncate silently.
        template<typename BasicJsonType>
        bool readStatus(const BasicJsonType &j, const char *key, std::uint16_t &out) {
            auto it = j.find(key);
            if (it == j.end() || it->is_null()) {
                return false;
            }
            if (!it->is_number_integer()) {
                throw std::invalid_argument(std::string(key) + " must be an integer, got "
                                            + it->type_name());
            }
            if (it->is_number_unsigned() ? it->template get<std::uint64_t>() > 65535u
                                         : it->template get<std::int64_t>() < 0
                                           || it->template get<std::int64_t>() > 65535) {
                throw std::invalid_argument(std::string(key) + " out of range: " + it->dump());
            }
            out = static_cast<std::uint16_t>(it->template get<std::int64_t>());
            return true;
        }

        template<typename BasicJsonType>
        void requireObject(const BasicJsonType &j, const char *what) {
            if (!j.is_object()) {
                throw std::invalid_argument(std::string(what) + " must be a JSON object, got "
                                            + j.type_name());
            }
        }
    } // namespace detail

    template<typename BasicJsonType>
    void to_json(BasicJsonType &j, LogSeverity severity) {
        j = getSeverityToken(severity);
    }

    template<typename BasicJsonType>
    void from_json(const BasicJsonType &j, LogSeverity &severity) {
        severity = parseSeverity(j.template get<std::string>());
    }

    template<typename BasicJsonType>
    void to_json(BasicJsonType &j, HttpMethod method) {
        j = getHttpMethodToken(method);
    }

    template<typename BasicJsonType>
    void from_json(const BasicJsonType &j, HttpMethod &method) {
        method = parseHttpMethod(j.template get<std::string>());
    }

    template<typename BasicJsonType>
    void to_json(BasicJsonType &j, const Operation &operation) {
        j = BasicJsonType::object();
        if (operation.hasId()) j[keys::kId] = operation.id();
        if (operation.hasProducer()) j[keys::kProducer] = operation.producer();
        if (operation.hasFirst()) j[keys::kFirst] = operation.first();
        if (operation.hasLast()) j[keys::kLast] = operation.last();
    }

    template<typename BasicJsonType>
    void from_json(const BasicJsonType &j, Operation &operation) {
        detail::requireObject(j, keys::kOperation);
        operation = Operation();
        std::string text;
        bool flag = false;
        if (detail::readMember(j, keys::kId, text)) operation.setId(text);
        if (detail::readMember(j, keys::kProducer, text)) operation.setProducer(text);
        if (detail::readMember(j, keys::kFirst, flag)) operation.setFirst(flag);
        if (detail::readMember(j, keys::kLast, flag)) operation.setLast(flag);
    }

    template<typename BasicJsonType>
    void to_json(BasicJsonType &j, const SourceLocation &location) {
        j = BasicJsonType::object();
        if (location.hasFile()) j[keys::kFile] = location.file();
        if (location.hasLine()) j[keys::kLine] = location.line();
        if (location.hasFunction()) j[keys::kFunction] = location.function();
    }

    template<typename BasicJsonType>
    void from_json(const BasicJsonType &j, SourceLocation &location) {
        detail::requireObject(j, keys::kSourceLocation);
        location = SourceLocation();
        std::string text;
        if (detail::readMember(j, keys::kFile, text)) location.setFile(text);
        if (detail::readMember(j, keys::kLine, text)) location.setLine(text);
        if (detail::readMember(j, keys::kFunction, text)) location.setFunction(text);
    }

    template<typename BasicJsonType>
    void to_json(BasicJsonType &j, const HttpRequest &request) {
        j = BasicJsonType::object();
        if (request.hasRequestMethod()) j[keys::kRequestMethod] = getHttpMethodToken(request.requestMethod());
        if (request.hasRequestUrl()) j[keys::kRequestUrl] = request.requestUrl();
        if (request.hasRequestSize()) j[keys::kRequestSize] = request.requestSize();
        if (request.hasStatus()) j[keys::kStatus] = request.status();
        if (request.hasResponseSize()) j[keys::kResponseSize] = request.responseSize();
        if (request.hasUserAgent()) j[keys::kUserAgent] = request.userAgent();
        if (request.hasRemoteIp()) j[keys::kRemoteIp] = request.remoteIp();
        if (request.hasServerIp()) j[keys::kServerIp] = request.serverIp();
        if (request.hasLatency()) j[keys::kLatency] = request.latency();
        if (request.hasProtocol()) j[keys::kProtocol] = request.protocol();
    }

    template<typename BasicJsonType>
    void from_json(const BasicJsonType &j, HttpRequest &request) {
        detail::requireObject(j, keys::kHttpRequest);
        request = HttpRequest();
        std::string text;
        std::uint16_t status = 0;
        if (detail::readMember(j, keys::kRequestMethod, text)) request.setRequestMethod(parseHttpMethod(text));
        if (detail::readMember(j, keys::kRequestUrl, text)) request.setRequestUrl(text);
        if (detail::readMember(j, keys::kRequestSize, text)) request.setRequestSize(text);
        if (detail::readStatus(j, keys::kStatus, status)) request.setStatus(status);
        if (detail::readMember(j, keys::kResponseSize, text)) request.setResponseSize(text);
        if (detail::readMember(j, keys::kUserAgent, text)) request.setUserAgent(text);
        if (detail::readMember(j, keys::kRemoteIp, text)) request.setRemoteIp(text);
        if (detail::readMember(j, keys::kServerIp, text)) request.setServerIp(text);
        if (detail::readMember(j, keys::kLatency, text)) request.setLatency(text);
        if (detail::readMember(j, keys::kProtocol, text)) request.setProtocol(text);
    }

    template<typename BasicJsonType>
    void to_json(BasicJsonType &j, const StructuredLogEntry &entry) {
        // Insertion order matters for ordered_json: keys follow the schema.
        j = BasicJsonType::object();
        if (entry.hasSeverity()) j[keys::kSeverity] = getSeverityToken(entry.severity());
        if (entry.hasMessage()) j[keys::kMessage] = entry.message();
        if (entry.hasReportType()) j[keys::kReportType] = entry.reportType();
        if (entry.hasHttpRequest()) j[keys::kHttpRequest] = entry.httpRequest();
        if (entry.hasTime()) j[keys::kTime] = formatTimestamp(entry.time());
        if (entry.hasInsertId()) j[keys::kInsertId] = entry.insertId();
        if (!entry.labels().empty()) {
            BasicJsonType labels = BasicJsonType::object();
            for (const auto &label : entry.labels()) {
                labels[label.first] = label.second;
            }
            j[keys::kLabels] = std::move(labels);
        }
        if (entry.hasOperation()) j[keys::kOperation] = entry.operation();
        if (entry.hasSourceLocation()) j[keys::kSourceLocation] = entry.sourceLocation();
        if (entry.hasSpanId()) j[keys::kSpanId] = entry.spanId();
        if (entry.hasTrace()) j[keys::kTrace] = entry.trace();
        if (entry.hasTraceSampled()) j[keys::kTraceSampled] = entry.traceSampled();
    }

    template<typename BasicJsonType>
    void from_json(const BasicJsonType &j, StructuredLogEntry &entry) {
        detail::requireObject(j, "log entry");
        entry = StructuredLogEntry();
        std::string text;
        bool flag = false;

        if (detail::readMember(j, keys::kSeverity, text)) entry.setSeverity(parseSeverity(text));
        if (detail::readMember(j, keys::kMessage, text)) entry.setMessage(text);
        if (detail::readMember(j, keys::kReportType, text)) entry.setReportType(text);

        HttpRequest request;
        if (detail::readMember(j, keys::kHttpRequest, request)) entry.setHttpRequest(request);

        if (detail::readMember(j, keys::kTime, text)) entry.setTime(parseTimestamp(text));
        if (detail::readMember(j, keys::kInsertId, text)) entry.setInsertId(text);

        auto labels = j.find(keys::kLabels);
        if (labels != j.end() && !labels->is_null()) {
            detail::requireObject(*labels, keys::kLabels);
            for (auto it = labels->begin(); it != labels->end(); ++it) {
                entry.addLabel(it.key(), it.value().template get<std::string>());
            }
        }

        Operation operation;
        if (detail::readMember(j, keys::kOperation, operation)) entry.setOperation(operation);

        SourceLocation location;
        if (detail::readMember(j, keys::kSourceLocation, location)) entry.setSourceLocation(location);

        if (detail::readMember(j, keys::kSpanId, text)) entry.setSpanId(text);
        if (detail::readMember(j, keys::kTrace, text)) entry.setTrace(text);
        if (detail::readMember(j, keys::kTraceSampled, flag)) entry.setTraceSampled(flag);
    }

    inline Json toJson(const StructuredLogEntry &entry) {
        Json j;
        to_json(j, entry);
        return j;
    }

    /// Serialize an entry as one compact JSON object with no raw newlines,
    /// ready to be written as a single line of line-delimited JSON.
    ///
    /// @throws EncodingError if a text field is not valid UTF-8.
    inline std::string toJsonLine(const StructuredLogEntry &entry) {
        try {
            return toJson(entry).dump();
        } catch (const nlohmann::json::type_error &e) {
            throw EncodingError(e.what());
        }
    }

    /// @throws std::invalid_argument on wrong value types, unknown severity
    ///         or method tokens and malformed timestamps.
    template<typename BasicJsonType>
    StructuredLogEntry fromJson(const BasicJsonType &j) {
        try {
            StructuredLogEntry entry;
            from_json(j, entry);
            return entry;
        } catch (const nlohmann::json::exception &e) {
            throw std::invalid_argument(std::string("Malformed log entry: ") + e.what());
        }
    }

    /// @throws std::invalid_argument if the text is not a JSON log entry.
    inline StructuredLogEntry parseJsonLine(const std::string &line) {
        Json j;
        try {
            j = Json::parse(line);
        } catch (const nlohmann::json::parse_error &e) {
            throw std::invalid_argument(std::string("Invalid JSON log line: ") + e.what());
        }
        return fromJson(j);
    }
} // namespace gcplog

#endif // GCP_LOG_JSON_CODEC_HPP

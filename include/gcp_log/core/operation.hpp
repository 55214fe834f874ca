#ifndef GCP_LOG_OPERATION_HPP
#define GCP_LOG_OPERATION_HPP

#include "optional_field.hpp"
#include <string>

namespace gcplog {
    /// Groups related log entries into one logical operation.
    /// Entries sharing an id (and producer) belong to the same operation.
    class Operation {
    public:
        bool hasId() const { return m_id.has(); }
        const std::string &id() const { return m_id.get(); }
        Operation &setId(std::string id) {
            m_id.set(std::move(id));
            return *this;
        }
        void clearId() { m_id.reset(); }

        /// The combination of id and producer must be globally unique,
        /// e.g. "MyDivision.MyBigCompany.com" or "github.com/MyProject/MyApplication".
        bool hasProducer() const { return m_producer.has(); }
        const std::string &producer() const { return m_producer.get(); }
        Operation &setProducer(std::string producer) {
            m_producer.set(std::move(producer));
            return *this;
        }
        void clearProducer() { m_producer.reset(); }

        bool hasFirst() const { return m_first.has(); }
        bool first() const { return m_first.get(); }
        Operation &setFirst(bool first) {
            m_first.set(first);
            return *this;
        }
        void clearFirst() { m_first.reset(); }

        bool hasLast() const { return m_last.has(); }
        bool last() const { return m_last.get(); }
        Operation &setLast(bool last) {
            m_last.set(last);
            return *this;
        }
        void clearLast() { m_last.reset(); }

        bool empty() const {
            return !m_id.has() && !m_producer.has() && !m_first.has() && !m_last.has();
        }

        bool operator==(const Operation &other) const {
            return m_id == other.m_id && m_producer == other.m_producer
                   && m_first == other.m_first && m_last == other.m_last;
        }

        bool operator!=(const Operation &other) const { return !(*this == other); }

    private:
        detail::OptionalField<std::string> m_id;
        detail::OptionalField<std::string> m_producer;
        detail::OptionalField<bool> m_first;
        detail::OptionalField<bool> m_last;
    };
} // namespace gcplog

#endif // GCP_LOG_OPERATION_HPP

#ifndef GCP_LOG_OPTIONAL_FIELD_HPP
#define GCP_LOG_OPTIONAL_FIELD_HPP

#include <utility>

namespace gcplog {
namespace detail {

    /// Value slot that remembers whether it was assigned.
    ///
    /// Every schema field is stored in one of these so that "absent" and
    /// "set to the default value" stay distinguishable; absent slots are
    /// skipped entirely by the JSON codec.  get() on an absent slot returns
    /// a value-initialized T.
    template<typename T>
    class OptionalField {
    public:
        OptionalField() : m_present(false), m_value() {}

        bool has() const { return m_present; }

        const T &get() const { return m_value; }

        void set(T value) {
            m_value = std::move(value);
            m_present = true;
        }

        T &mutableValue() {
            m_present = true;
            return m_value;
        }

        void reset() {
            m_value = T();
            m_present = false;
        }

        bool operator==(const OptionalField &other) const {
            if (m_present != other.m_present) return false;
            return !m_present || m_value == other.m_value;
        }

        bool operator!=(const OptionalField &other) const {
            return !(*this == other);
        }

    private:
        bool m_present;
        T m_value;
    };

} // namespace detail
} // namespace gcplog

#endif // GCP_LOG_OPTIONAL_FIELD_HPP

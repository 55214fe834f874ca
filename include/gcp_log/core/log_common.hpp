#ifndef GCP_LOG_COMMON_HPP
#define GCP_LOG_COMMON_HPP

#include <chrono>
#include <ctime>
#include <memory>
#include <utility>

namespace gcplog {
namespace detail {
#if __cplusplus < 201402L
    template<typename T, typename... Args>
    std::unique_ptr<T> make_unique(Args&&... args) {
        return std::unique_ptr<T>(new T(std::forward<Args>(args)...));
    }
#else
    using std::make_unique;
#endif

    inline std::tm toUtcTm(std::time_t seconds) {
        std::tm tmBuf;
#if defined(_MSC_VER)
        gmtime_s(&tmBuf, &seconds);
#else
        gmtime_r(&seconds, &tmBuf);
#endif
        return tmBuf;
    }

    // Days since 1970-01-01 for a proleptic Gregorian date (H. Hinnant).
    inline long long daysFromCivil(long long y, unsigned m, unsigned d) {
        y -= m <= 2 ? 1 : 0;
        const long long era = (y >= 0 ? y : y - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(y - era * 400);
        const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<long long>(doe) - 719468;
    }

    inline bool isLeapYear(long long y) {
        return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    }

    inline unsigned daysInMonth(long long y, unsigned m) {
        static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (m == 2 && isLeapYear(y)) return 29;
        return kDays[m - 1];
    }
} // namespace detail
} // namespace gcplog

#endif // GCP_LOG_COMMON_HPP

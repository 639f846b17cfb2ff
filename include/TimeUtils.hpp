#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <chrono>
#include <string>

namespace CFSM {

using TimePoint = std::chrono::system_clock::time_point;

namespace TimeUtils {

    constexpr long SECONDS_PER_DAY = 86400;

    /**
     * @brief UTC time point from civil date/time fields
     * @throws std::invalid_argument for out-of-range fields
     */
    TimePoint makeUtc(int year, int month, int day,
                      int hour = 0, int minute = 0, int second = 0);

    /**
     * @brief Parse "YYYY-MM-DD HH:MM:SS[.fff]" as UTC, discarding fractions
     * @throws std::invalid_argument if the text is not in that form
     */
    TimePoint parseIsoUtc(const std::string& text);

    TimePoint addDays(TimePoint t, long days);

    int yearOf(TimePoint t);

    // "YYYY-MM-DD HH:MM:SS"
    std::string formatUtc(TimePoint t);
}

} // namespace CFSM

#endif // TIME_UTILS_HPP

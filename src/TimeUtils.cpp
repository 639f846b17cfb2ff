#include "TimeUtils.hpp"
#include <ctime>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace CFSM {
namespace TimeUtils {

namespace {

bool isLeap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (month == 2 && isLeap(year)) ? 29 : days[month - 1];
}

} // namespace

TimePoint makeUtc(int year, int month, int day, int hour, int minute, int second) {
    if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month) ||
        hour < 0 || hour > 23 || minute < 0 || minute > 59 ||
        second < 0 || second > 60) {
        std::ostringstream oss;
        oss << "Invalid date/time " << year << "-" << month << "-" << day << " "
            << hour << ":" << minute << ":" << second;
        throw std::invalid_argument(oss.str());
    }

    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

TimePoint parseIsoUtc(const std::string& text) {
    int year, month, day, hour, minute, second;
    char tail = '\0';
    int n = std::sscanf(text.c_str(), "%d-%d-%d %d:%d:%d%c",
                        &year, &month, &day, &hour, &minute, &second, &tail);
    if (n < 6 || (n == 7 && tail != '.')) {
        throw std::invalid_argument("Cannot parse date/time '" + text + "'");
    }
    return makeUtc(year, month, day, hour, minute, second);
}

TimePoint addDays(TimePoint t, long days) {
    return t + std::chrono::seconds(days * SECONDS_PER_DAY);
}

int yearOf(TimePoint t) {
    std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm tm = {};
    gmtime_r(&tt, &tm);
    return tm.tm_year + 1900;
}

std::string formatUtc(TimePoint t) {
    std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm tm = {};
    gmtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

} // namespace TimeUtils
} // namespace CFSM

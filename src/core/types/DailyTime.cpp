#include "core/types/DailyTime.hpp"

#include "core/Errors.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace hostwatch::core {

namespace {

std::chrono::system_clock::time_point atLocalTime(std::tm day, int hour, int minute) {
    day.tm_hour = hour;
    day.tm_min = minute;
    day.tm_sec = 0;
    day.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&day));
}

} // namespace

DailyTime DailyTime::parse(const std::string& text) {
    if (text.size() != 5 || text[2] != ':' || !std::isdigit(static_cast<unsigned char>(text[0])) ||
        !std::isdigit(static_cast<unsigned char>(text[1])) ||
        !std::isdigit(static_cast<unsigned char>(text[3])) ||
        !std::isdigit(static_cast<unsigned char>(text[4]))) {
        throw ConfigurationError("Invalid time of day '" + text + "', expected HH:mm");
    }

    DailyTime time;
    time.hour = (text[0] - '0') * 10 + (text[1] - '0');
    time.minute = (text[3] - '0') * 10 + (text[4] - '0');

    if (time.hour > 23 || time.minute > 59) {
        throw ConfigurationError("Time of day out of range: " + text);
    }
    return time;
}

std::string DailyTime::toString() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << hour << ':' << std::setw(2) << minute;
    return oss.str();
}

std::chrono::system_clock::time_point
DailyTime::nextOccurrence(std::chrono::system_clock::time_point now) const {
    std::time_t nowTime = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&nowTime, &local);

    auto next = atLocalTime(local, hour, minute);
    if (now > next) {
        local.tm_mday += 1;
        next = atLocalTime(local, hour, minute);
    }
    return next;
}

std::chrono::milliseconds
DailyTime::delayUntilNext(std::chrono::system_clock::time_point now) const {
    auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(nextOccurrence(now) - now);
    return delay.count() < 0 ? std::chrono::milliseconds(0) : delay;
}

} // namespace hostwatch::core

#include "flowcore/workflow/time_utils.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>

namespace flowcore {
namespace workflow {

std::string format_iso8601(TimePoint tp) {
    auto time_t = Clock::to_time_t(tp);
    auto duration = tp.time_since_epoch();
    auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(duration) % 1000000;
    if (microseconds.count() < 0) {
        microseconds += std::chrono::microseconds(1000000);
        time_t -= 1;
    }

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t);
#else
    gmtime_r(&time_t, &tm_buf);
#endif

    char buf[40];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06ldZ",
             tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
             static_cast<long>(microseconds.count()));

    return std::string(buf);
}

std::string iso8601_now() {
    return format_iso8601(Clock::now());
}

std::optional<TimePoint> parse_iso8601(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    long micros = 0;
    char frac[16] = {0};

    int matched = sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%15[0-9]",
                         &year, &month, &day, &hour, &minute, &second, frac);
    if (matched < 6) {
        return std::nullopt;
    }
    if (matched == 7) {
        // Right-pad to microsecond precision
        std::string digits(frac);
        digits.resize(6, '0');
        micros = std::stol(digits);
    }

    std::tm tm_buf{};
    tm_buf.tm_year = year - 1900;
    tm_buf.tm_mon = month - 1;
    tm_buf.tm_mday = day;
    tm_buf.tm_hour = hour;
    tm_buf.tm_min = minute;
    tm_buf.tm_sec = second;

#ifdef _WIN32
    std::time_t seconds = _mkgmtime(&tm_buf);
#else
    std::time_t seconds = timegm(&tm_buf);
#endif
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }

    return Clock::from_time_t(seconds) + std::chrono::microseconds(micros);
}

} // namespace workflow
} // namespace flowcore

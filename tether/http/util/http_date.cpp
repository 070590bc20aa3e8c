#include "http_date.hpp"
#include <array>
#include <cstdio>
#include <ctime>

namespace tether::http::util {

    namespace {
        // fixed english names, strftime %a and %b depend on the locale
        constexpr std::array<const char*, 7> week_days{"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
        constexpr std::array<const char*, 12> months{"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                                     "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    }

    std::string format_http_date(std::chrono::system_clock::time_point time) {
        std::time_t t = std::chrono::system_clock::to_time_t(time);
        std::tm tm{};
        gmtime_r(&t, &tm);

        char buf[32];
        std::snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d GMT",
                      week_days[tm.tm_wday], tm.tm_mday, months[tm.tm_mon], tm.tm_year + 1900,
                      tm.tm_hour, tm.tm_min, tm.tm_sec);
        return buf;
    }

}

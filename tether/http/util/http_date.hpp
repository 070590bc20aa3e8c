#ifndef TETHER_HTTP_UTIL_HTTP_DATE_HPP
#define TETHER_HTTP_UTIL_HTTP_DATE_HPP

#include <chrono>
#include <string>

namespace tether::http::util {

    // IMF-fixdate as used by the Date header, i.e., "Sun, 06 Nov 1994 08:49:37 GMT"
    std::string format_http_date(std::chrono::system_clock::time_point time);

}

#endif

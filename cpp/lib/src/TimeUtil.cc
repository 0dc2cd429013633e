/** \file    TimeUtil.cc
 *  \brief   Implementation of time-related utility functions.
 *
 *  \copyright 2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include "TimeUtil.h"
#include <stdexcept>
#include <cerrno>
#include <cstring>
#include <sys/time.h>
#include "util.h"


namespace TimeUtil {


std::string GetCurrentDateAndTime(const std::string &format, const TimeZone time_zone) {
    time_t now;
    std::time(&now);
    return TimeTToString(now, format, time_zone);
}


std::string TimeTToString(const time_t &the_time, const std::string &format, const TimeZone time_zone) {
    struct tm tm;
    if (unlikely((time_zone == LOCAL ? ::localtime_r(&the_time, &tm) : ::gmtime_r(&the_time, &tm)) == nullptr))
        throw std::runtime_error("in TimeUtil::TimeTToString: time conversion error!");

    char time_buf[50 + 1];
    if (unlikely(std::strftime(time_buf, sizeof(time_buf), format.c_str(), &tm) == 0))
        throw std::runtime_error("in TimeUtil::TimeTToString: strftime(3) failed! (format: " + format + ")");

    return time_buf;
}


time_t TimeGm(const struct tm &tm) {
    struct tm temp_tm(tm);
    errno = 0;
    const time_t ret_val(::timegm(&temp_tm));
    if (unlikely(errno != 0))
        return BAD_TIME_T;

    return ret_val;
}


bool Iso8601StringToTimeT(const std::string &iso_time, time_t * const converted_time) {
    static const char * const FORMATS[] = { "%Y-%m-%dT%H:%M:%SZ", "%Y-%m-%dT%H:%M:%S", "%Y-%m-%d %H:%M:%S" };

    for (const auto format : FORMATS) {
        struct tm tm;
        std::memset(&tm, 0, sizeof tm);
        const char * const last_char(::strptime(iso_time.c_str(), format, &tm));
        if (last_char == nullptr or *last_char != '\0')
            continue;

        *converted_time = TimeGm(tm);
        return *converted_time != BAD_TIME_T;
    }

    return false;
}


uint64_t GetCurrentTimeInMicroseconds() {
    timeval time_val;
    ::gettimeofday(&time_val, nullptr);
    return 1000000ULL * static_cast<uint64_t>(time_val.tv_sec) + static_cast<uint64_t>(time_val.tv_usec);
}


void Millisleep(const unsigned sleep_interval) {
    timespec time_spec;
    time_spec.tv_sec  = sleep_interval / 1000u;
    time_spec.tv_nsec = static_cast<long>(sleep_interval % 1000u) * 1000000L;
    while (::nanosleep(&time_spec, &time_spec) == -1 and errno == EINTR)
        /* Intentionally empty! */;
}


} // namespace TimeUtil

/** \file    TimeUtil.h
 *  \brief   Declarations of time-related utility functions.
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
#pragma once


#include <string>
#include <cstdint>
#include <ctime>


namespace TimeUtil {


const std::string ISO_8601_FORMAT("%Y-%m-%dT%T"); // This is only one of several possible ISO 8601 date/time formats!
const std::string ZULU_FORMAT("%Y-%m-%dT%H:%M:%SZ");

// Compact basic ISO 8601 form w/o the zone designator, used where timestamps must sort lexically, e.g. in object keys.
const std::string COMPACT_FORMAT("%Y%m%dT%H%M%S");


const time_t BAD_TIME_T(static_cast<time_t>(-1));


enum TimeZone { UTC, LOCAL };


/** \brief   Get the current date and time as a string.
 *  \param   format     The format of the date and time string, see strftime(3).
 *  \param   time_zone  Whether to use local time (the default) or UTC.
 */
std::string GetCurrentDateAndTime(const std::string &format, const TimeZone time_zone = LOCAL);


/** \throws std::runtime_error if the conversion failed. */
std::string TimeTToString(const time_t &the_time, const std::string &format, const TimeZone time_zone = LOCAL);


inline std::string TimeTToUtcString(const time_t &the_time, const std::string &format)
    { return TimeTToString(the_time, format, UTC); }


/** \return "the_time" formatted as YYYY-MM-DDTHH:MM:SSZ. */
inline std::string TimeTToZuluString(const time_t &the_time) { return TimeTToString(the_time, ZULU_FORMAT, UTC); }


/** \brief  The inverse of gmtime(3).  Unlike mktime(3) "tm" is interpreted as UTC and not modified.
 *  \return The converted time or BAD_TIME_T on failure.
 */
time_t TimeGm(const struct tm &tm);


/** \brief  Parses "YYYY-MM-DDTHH:MM:SSZ" or "YYYY-MM-DD HH:MM:SS" (interpreted as UTC).
 *  \return True on success, else false.
 */
bool Iso8601StringToTimeT(const std::string &iso_time, time_t * const converted_time);


/** Returns elapsed time since the Unix epoch in microseconds. */
uint64_t GetCurrentTimeInMicroseconds();


/** \brief  Suspends the calling thread for "sleep_interval" milliseconds. */
void Millisleep(const unsigned sleep_interval);


} // namespace TimeUtil

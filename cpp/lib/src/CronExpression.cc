/** \file   CronExpression.cc
 *  \brief  Implementation of the CronExpression class.
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
#include "CronExpression.h"
#include <map>
#include <stdexcept>
#include <vector>
#include "StringUtil.h"
#include "TimeUtil.h"
#include "util.h"


namespace {


// Bounds how far nextFireTime() searches.  Leap days on a given weekday recur within 28 years.
const int MAX_YEARS_TO_SEARCH(30);


const std::map<std::string, std::string> SHORTCUTS_TO_EXPRESSIONS_MAP{
    { "@yearly",   "0 0 1 1 *" },
    { "@annually", "0 0 1 1 *" },
    { "@monthly",  "0 0 1 * *" },
    { "@weekly",   "0 0 * * 0" },
    { "@daily",    "0 0 * * *" },
    { "@midnight", "0 0 * * *" },
    { "@hourly",   "0 * * * *" },
};


const std::map<std::string, unsigned> MONTH_NAMES_TO_NUMBERS_MAP{
    { "JAN", 1 }, { "FEB", 2 }, { "MAR", 3 }, { "APR", 4 }, { "MAY", 5 }, { "JUN", 6 },
    { "JUL", 7 }, { "AUG", 8 }, { "SEP", 9 }, { "OCT", 10 }, { "NOV", 11 }, { "DEC", 12 },
};


const std::map<std::string, unsigned> WEEKDAY_NAMES_TO_NUMBERS_MAP{
    { "SUN", 0 }, { "MON", 1 }, { "TUE", 2 }, { "WED", 3 }, { "THU", 4 }, { "FRI", 5 }, { "SAT", 6 },
};


struct FieldSpec {
    const char *name_;
    unsigned min_, max_;
    const std::map<std::string, unsigned> *names_to_numbers_map_;
};


const FieldSpec SECOND_SPEC{ "second", 0, 59, nullptr };
const FieldSpec MINUTE_SPEC{ "minute", 0, 59, nullptr };
const FieldSpec HOUR_SPEC{ "hour", 0, 23, nullptr };
const FieldSpec DAY_OF_MONTH_SPEC{ "day-of-month", 1, 31, nullptr };
const FieldSpec MONTH_SPEC{ "month", 1, 12, &MONTH_NAMES_TO_NUMBERS_MAP };
const FieldSpec DAY_OF_WEEK_SPEC{ "day-of-week", 0, 7, &WEEKDAY_NAMES_TO_NUMBERS_MAP };


unsigned ParseValue(const std::string &value, const FieldSpec &spec) {
    unsigned number;
    if (StringUtil::ToUnsigned(value, &number)) {
        if (unlikely(number < spec.min_ or number > spec.max_))
            throw std::runtime_error(std::string(spec.name_) + " value " + value + " is not in [" + std::to_string(spec.min_) + ","
                                     + std::to_string(spec.max_) + "]");
        return number;
    }

    if (spec.names_to_numbers_map_ != nullptr) {
        const auto name_and_number(spec.names_to_numbers_map_->find(StringUtil::ToUpper(value)));
        if (name_and_number != spec.names_to_numbers_map_->cend())
            return name_and_number->second;
    }

    throw std::runtime_error("invalid " + std::string(spec.name_) + " value \"" + value + "\"");
}


// Sets the bits for all values matched by "field".  Bits are indexed by value.
template <size_t N> void ParseField(const std::string &field, const FieldSpec &spec, std::bitset<N> * const bits) {
    std::vector<std::string> items;
    StringUtil::Split(field, ',', &items);
    for (const auto &item : items) {
        if (unlikely(item.empty()))
            throw std::runtime_error("empty list element in " + std::string(spec.name_) + " field \"" + field + "\"");

        std::string range(item);
        unsigned step(1);
        const auto slash_pos(item.find('/'));
        if (slash_pos != std::string::npos) {
            range = item.substr(0, slash_pos);
            if (unlikely(not StringUtil::ToUnsigned(item.substr(slash_pos + 1), &step) or step == 0 or step > spec.max_))
                throw std::runtime_error("invalid step in " + std::string(spec.name_) + " field \"" + field + "\"");
        }

        unsigned first, last;
        if (range == "*") {
            first = spec.min_;
            last  = spec.max_;
        } else {
            const auto dash_pos(range.find('-'));
            if (dash_pos == std::string::npos) {
                first = ParseValue(range, spec);
                last  = (slash_pos == std::string::npos) ? first : spec.max_; // "a/n" means "a-max/n".
            } else {
                first = ParseValue(range.substr(0, dash_pos), spec);
                last  = ParseValue(range.substr(dash_pos + 1), spec);
            }
        }
        if (unlikely(first > last))
            throw std::runtime_error("empty range \"" + range + "\" in " + std::string(spec.name_) + " field");

        for (unsigned value(first); value <= last; value += step)
            bits->set(value % N); // Maps a day-of-week of 7 to Sunday.
    }
}


} // unnamed namespace


CronExpression::CronExpression(const std::string &expression): expression_(StringUtil::Trim(expression)) {
    std::string expanded_expression(expression_);
    if (StringUtil::StartsWith(expanded_expression, "@")) {
        const auto shortcut_and_expression(SHORTCUTS_TO_EXPRESSIONS_MAP.find(StringUtil::ToLower(expanded_expression)));
        if (unlikely(shortcut_and_expression == SHORTCUTS_TO_EXPRESSIONS_MAP.cend()))
            throw std::runtime_error("in CronExpression::CronExpression: unknown shortcut \"" + expression_ + "\"!");
        expanded_expression = shortcut_and_expression->second;
    }

    for (auto &ch : expanded_expression) {
        if (ch == '\t')
            ch = ' ';
    }
    std::vector<std::string> fields;
    StringUtil::Split(expanded_expression, ' ', &fields, /* suppress_empty_components = */true);
    if (fields.size() == 5)
        fields.insert(fields.begin(), "0");
    else if (unlikely(fields.size() != 6))
        throw std::runtime_error("in CronExpression::CronExpression: \"" + expression_ + "\" has " + std::to_string(fields.size())
                                 + " fields, expected 5 or 6!");

    try {
        ParseField(fields[0], SECOND_SPEC, &seconds_);
        ParseField(fields[1], MINUTE_SPEC, &minutes_);
        ParseField(fields[2], HOUR_SPEC, &hours_);
        ParseField(fields[3], DAY_OF_MONTH_SPEC, &days_of_month_);
        ParseField(fields[4], MONTH_SPEC, &months_);
        ParseField(fields[5], DAY_OF_WEEK_SPEC, &days_of_week_);
    } catch (const std::runtime_error &x) {
        throw std::runtime_error("in CronExpression::CronExpression: bad expression \"" + expression_ + "\": " + std::string(x.what()) + "!");
    }
    day_of_month_is_star_ = StringUtil::StartsWith(fields[3], "*");
    day_of_week_is_star_  = StringUtil::StartsWith(fields[5], "*");
}


bool CronExpression::dayMatches(const struct tm &tm) const {
    const bool day_of_month_matches(days_of_month_.test(static_cast<size_t>(tm.tm_mday)));
    const bool day_of_week_matches(days_of_week_.test(static_cast<size_t>(tm.tm_wday)));
    if (day_of_month_is_star_ or day_of_week_is_star_)
        return day_of_month_matches and day_of_week_matches;
    return day_of_month_matches or day_of_week_matches;
}


bool CronExpression::matches(const time_t time) const {
    struct tm tm;
    if (unlikely(::gmtime_r(&time, &tm) == nullptr))
        return false;

    return seconds_.test(static_cast<size_t>(tm.tm_sec)) and minutes_.test(static_cast<size_t>(tm.tm_min))
           and hours_.test(static_cast<size_t>(tm.tm_hour)) and months_.test(static_cast<size_t>(tm.tm_mon + 1)) and dayMatches(tm);
}


time_t CronExpression::nextFireTime(const time_t after) const {
    time_t candidate(after + 1);
    struct tm tm;
    if (unlikely(::gmtime_r(&candidate, &tm) == nullptr))
        return TimeUtil::BAD_TIME_T;
    const int last_year_to_search(tm.tm_year + MAX_YEARS_TO_SEARCH);

    // Each step either accepts a field or advances to the start of the next unit of that field, resetting everything
    // below it.  TimeGm() normalises overflows, e.g. a month of 12 or a day of 32.
    for (;;) {
        if (tm.tm_year > last_year_to_search)
            return TimeUtil::BAD_TIME_T;

        if (not months_.test(static_cast<size_t>(tm.tm_mon + 1))) {
            ++tm.tm_mon;
            tm.tm_mday = 1;
            tm.tm_hour = tm.tm_min = tm.tm_sec = 0;
        } else if (not dayMatches(tm)) {
            ++tm.tm_mday;
            tm.tm_hour = tm.tm_min = tm.tm_sec = 0;
        } else if (not hours_.test(static_cast<size_t>(tm.tm_hour))) {
            ++tm.tm_hour;
            tm.tm_min = tm.tm_sec = 0;
        } else if (not minutes_.test(static_cast<size_t>(tm.tm_min))) {
            ++tm.tm_min;
            tm.tm_sec = 0;
        } else if (not seconds_.test(static_cast<size_t>(tm.tm_sec)))
            ++tm.tm_sec;
        else
            return TimeUtil::TimeGm(tm);

        candidate = TimeUtil::TimeGm(tm);
        if (unlikely(candidate == TimeUtil::BAD_TIME_T or ::gmtime_r(&candidate, &tm) == nullptr))
            return TimeUtil::BAD_TIME_T;
    }
}

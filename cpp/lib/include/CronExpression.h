/** \file   CronExpression.h
 *  \brief  Parsing and evaluation of cron schedules.
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


#include <bitset>
#include <string>
#include <ctime>


/** \class  CronExpression
 *  \brief  A schedule in the usual cron syntax, always evaluated in UTC.
 *  \note   Five fields (minute hour day-of-month month day-of-week) or six w/ a leading seconds field.  Fields may be
 *          "*", numbers, ranges "a-b", lists "a,b", steps "*\/n", "a-b/n" and "a/n", month names JAN-DEC and weekday
 *          names SUN-SAT.  Weekday 7 is Sunday as well.  If neither day-of-month nor day-of-week starts w/ a "*", a day
 *          matches if either of them matches, otherwise both have to match.  The shortcuts @yearly, @annually,
 *          @monthly, @weekly, @daily, @midnight and @hourly are supported too.
 */
class CronExpression {
    std::string expression_;
    std::bitset<60> seconds_;
    std::bitset<60> minutes_;
    std::bitset<24> hours_;
    std::bitset<32> days_of_month_; // Bit 0 is unused.
    std::bitset<13> months_;        // Bit 0 is unused.
    std::bitset<7> days_of_week_;   // 0 is Sunday.
    bool day_of_month_is_star_, day_of_week_is_star_;
public:
    /** \throws std::runtime_error if "expression" can't be parsed. */
    explicit CronExpression(const std::string &expression);

    inline const std::string &toString() const { return expression_; }

    /** \return True if "time" (UTC), to the second, is a fire time. */
    bool matches(const time_t time) const;

    /** \return The first fire time strictly after "after" or TimeUtil::BAD_TIME_T if there is none within the next
     *          few years, e.g. for "0 0 30 2 *".
     */
    time_t nextFireTime(const time_t after) const;
private:
    bool dayMatches(const struct tm &tm) const;
};

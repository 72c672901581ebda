/** leasetime definitions file
 *  Description: Converts block timestamps into the calendar strings returned in lease responses,
 *               without depending on libc time support inside the contract.
 *  @file leasetime.hpp
 *  @license FIO Foundation ( https://github.com/fioprotocol/fio/blob/master/LICENSE )
 *
 *  Changes:
 */

#pragma once

#include <cstdint>
#include <string>

#define SECONDSPERDAY 86400
#define DAYS_PER_400Y (365*400 + 97)
#define DAYS_FROM_0000_03_01 719468   // days from 0000-03-01 to 1970-01-01

namespace leaseio {

    struct lease_tm {
        int64_t year = 1970;
        uint32_t month = 1;
        uint32_t day = 1;
        uint32_t hour = 0;
        uint32_t minute = 0;
        uint32_t second = 0;
    };

    /***
     * Splits seconds since 1970-01-01 into a proleptic gregorian date. Years are counted from
     * March 1st internally so the leap day falls at the end of the cycle.
     * @param t seconds since the epoch
     * @return the broken down UTC time
     */
    inline lease_tm convertleasetime(const uint64_t t) {
        lease_tm tm;
        const uint64_t days = t / SECONDSPERDAY;
        const uint64_t remsecs = t % SECONDSPERDAY;

        const uint64_t z = days + DAYS_FROM_0000_03_01;
        const uint64_t era = z / DAYS_PER_400Y;
        const uint64_t doe = z - era * DAYS_PER_400Y;                          // [0, 146096]
        const uint64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;   // [0, 399]
        const uint64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);          // [0, 365]
        const uint64_t mp = (5 * doy + 2) / 153;                               // [0, 11]

        tm.day = static_cast<uint32_t>(doy - (153 * mp + 2) / 5 + 1);
        tm.month = static_cast<uint32_t>(mp < 10 ? mp + 3 : mp - 9);
        tm.year = static_cast<int64_t>(yoe + era * 400) + (tm.month <= 2 ? 1 : 0);

        tm.hour = static_cast<uint32_t>(remsecs / 3600);
        tm.minute = static_cast<uint32_t>(remsecs / 60 % 60);
        tm.second = static_cast<uint32_t>(remsecs % 60);
        return tm;
    }

    inline void appendtwodigits(std::string &buffer, const uint32_t value) {
        if (value < 10) {
            buffer.append("0");
        }
        buffer.append(std::to_string(value));
    }

    inline std::string tmstringformat(const lease_tm &timeinfo) {
        std::string timebuffer = std::to_string(timeinfo.year);
        timebuffer.append("-");
        appendtwodigits(timebuffer, timeinfo.month);
        timebuffer.append("-");
        appendtwodigits(timebuffer, timeinfo.day);
        timebuffer.append("T");
        appendtwodigits(timebuffer, timeinfo.hour);
        timebuffer.append(":");
        appendtwodigits(timebuffer, timeinfo.minute);
        timebuffer.append(":");
        appendtwodigits(timebuffer, timeinfo.second);
        return timebuffer;
    }

    inline std::string formatleasetime(const uint64_t t) {
        return tmstringformat(convertleasetime(t));
    }
}

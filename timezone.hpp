/* The configured local timezone. Calendar dates ("tomorrow", "the last 14 days")
   and the daily 23:55 wake-up are all local; everything else runs on UTC ptimes.
*/

#pragma once
#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/local_time/local_time.hpp>

class Timezone {
public:
    // A POSIX TZ string with Boost's sign convention (east of UTC is positive),
    // e.g. "UTC+00", "CET+01CEST,M3.5.0/02:00,M10.5.0/03:00", "EST-05EDT,M3.2.0,M11.1.0".
    // Throws Config_error.
    Timezone(const std::string& spec);

    // A region name ("America/New_York") looked up in a Boost zone database CSV.
    // Throws Config_error.
    Timezone(const std::string& region, const std::string& database_file);

    static Timezone utc();

    boost::posix_time::ptime to_local(const boost::posix_time::ptime& utc) const;
    boost::gregorian::date local_date(const boost::posix_time::ptime& utc) const;

    // UTC instant of the wall clock time [tod] on local date [d]. Times skipped or
    // repeated by a DST change resolve to standard time.
    boost::posix_time::ptime to_utc(const boost::gregorian::date& d,
                                    const boost::posix_time::time_duration& tod) const;

    // today's [tod] if [utc_now] is still before it, tomorrow's otherwise
    boost::posix_time::ptime next_occurrence(const boost::posix_time::ptime& utc_now,
                                             const boost::posix_time::time_duration& tod) const;

    const std::string& get_name() const { return name; }

    static void test();
private:
    boost::local_time::time_zone_ptr zone;
    std::string name;
};

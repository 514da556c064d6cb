#include <sstream>
#include <cctype>
#include "timezone.hpp"
#include "errors.hpp"

using std::string;
using boost::posix_time::ptime;
using boost::posix_time::time_duration;
using boost::gregorian::date;
using boost::local_time::local_date_time;
using boost::local_time::posix_time_zone;
using boost::local_time::time_zone_ptr;

// boost's parser quietly accepts some junk ("Europe/London", "garbage"), so insist on
// at least "ABC" followed by an offset before handing it over
static bool looks_like_posix_spec(const string& spec) {
    size_t i = 0;
    while (i < spec.size() && std::isalpha(static_cast<unsigned char>(spec[i]))) i++;
    if (i < 3 || i == spec.size()) return false;
    char c = spec[i];
    return c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c));
}

Timezone::Timezone(const string& spec) : name(spec) {
    if (spec.find('/') != string::npos && spec.find(',') == string::npos) {
        throw Config_error("Timezone " + spec + " looks like a region name, which needs Boost's zone database: "
                           "pass --tz-database with the path to date_time_zonespec.csv, or give a POSIX TZ spec "
                           "such as CET+01CEST,M3.5.0,M10.5.0/03");
    }
    if (!looks_like_posix_spec(spec)) {
        throw Config_error("Can't parse timezone: " + spec);
    }
    try {
        zone = time_zone_ptr(new posix_time_zone(spec));
    } catch (const std::exception& e) {
        throw Config_error("Can't parse timezone " + spec + ": " + e.what());
    }
}

Timezone::Timezone(const string& region, const string& database_file) : name(region) {
    boost::local_time::tz_database db;
    try {
        db.load_from_file(database_file);
    } catch (const std::exception& e) {
        throw Config_error("Can't load zone database " + database_file + ": " + e.what());
    }
    zone = db.time_zone_from_region(region);
    if (!zone) {
        throw Config_error("Unknown timezone " + region + " in " + database_file);
    }
}

Timezone Timezone::utc() {
    return Timezone("UTC+00");
}

ptime Timezone::to_local(const ptime& utc) const {
    return local_date_time(utc, zone).local_time();
}

date Timezone::local_date(const ptime& utc) const {
    return to_local(utc).date();
}

ptime Timezone::to_utc(const date& d, const time_duration& tod) const {
    local_date_time ldt(d, tod, zone, local_date_time::NOT_DATE_TIME_ON_ERROR);
    if (!ldt.is_not_a_date_time()) return ldt.utc_time();
    return ptime(d, tod) - zone->base_utc_offset();
}

ptime Timezone::next_occurrence(const ptime& utc_now, const time_duration& tod) const {
    date today = local_date(utc_now);
    ptime t = to_utc(today, tod);
    if (utc_now >= t) {
        t = to_utc(today + boost::gregorian::days(1), tod);
    }
    return t;
}

void Timezone::test() {
    using boost::posix_time::time_from_string;
    const time_duration five_to_midnight = boost::posix_time::hours(23) + boost::posix_time::minutes(55);

    Timezone utc_tz = utc();
    Timezone est("EST-05");
    Timezone ny("EST-05EDT,M3.2.0,M11.1.0");

    std::stringstream output;
    std::stringstream expected;
    output << utc_tz.local_date(time_from_string("2025-01-31 23:59:59")) << std::endl
           << est.to_local(time_from_string("2025-01-15 03:00:00")) << std::endl
           << est.local_date(time_from_string("2025-01-15 03:00:00")) << std::endl
           << est.next_occurrence(time_from_string("2025-01-15 03:00:00"), five_to_midnight) << std::endl
           << est.next_occurrence(time_from_string("2025-01-15 04:55:00"), five_to_midnight) << std::endl
           << est.next_occurrence(time_from_string("2025-01-15 05:00:00"), five_to_midnight) << std::endl
           << ny.to_local(time_from_string("2025-07-04 12:00:00")) << std::endl
           << ny.next_occurrence(time_from_string("2025-07-04 12:00:00"), five_to_midnight) << std::endl
           << ny.next_occurrence(time_from_string("2025-12-31 12:00:00"), five_to_midnight) << std::endl
           << utc_tz.next_occurrence(time_from_string("2025-12-31 23:55:00"), five_to_midnight) << std::endl;

    expected << "2025-Jan-31" << std::endl
             << "2025-Jan-14 22:00:00" << std::endl
             << "2025-Jan-14" << std::endl
             << "2025-Jan-15 04:55:00" << std::endl  // still before 23:55 on the 14th
             << "2025-Jan-16 04:55:00" << std::endl  // exactly on it: tomorrow's
             << "2025-Jan-16 04:55:00" << std::endl
             << "2025-Jul-04 08:00:00" << std::endl
             << "2025-Jul-05 03:55:00" << std::endl  // EDT
             << "2026-Jan-01 04:55:00" << std::endl  // EST
             << "2026-Jan-01 23:55:00" << std::endl;

    std::string output_str = output.str();
    std::string expected_str = expected.str();
    if (output_str != expected_str) {
        throw std::runtime_error("Timezone::test() 1 failed, got\n" + output_str + ", but expected\n" + expected_str);
    }

    const char* bad[] = { "Europe/London", "garbage", "", "UTC", "EST-25" };
    for (const char* b : bad) {
        bool threw = false;
        try {
            Timezone tz(b);
        } catch (const Config_error&) {
            threw = true;
        }
        if (!threw) throw std::runtime_error(string("Timezone::test() 2 failed, accepted ") + b);
    }

    string region_error;
    try {
        Timezone tz("Europe/Berlin");
    } catch (const Config_error& e) {
        region_error = e.what();
    }
    if (region_error.find("--tz-database") == string::npos || region_error.find("date_time_zonespec.csv") == string::npos) {
        throw std::runtime_error("Timezone::test() 3 failed, region error doesn't name the zone database: " + region_error);
    }

    bool threw = false;
    try {
        Timezone tz("Europe/London", "/nonexistent/date_time_zonespec.csv");
    } catch (const Config_error&) {
        threw = true;
    }
    if (!threw) throw std::runtime_error("Timezone::test() 4 failed, missing zone database accepted");
}

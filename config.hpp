/* Runtime settings. Every option can come from the command line, the environment
   or an INI-style file given with --config, in that order of precedence. The
   environment names are the ones the deployment already uses (DICT_PATH,
   STATE_PATH, TIMEZONE, DISCORD_BOT_TOKEN, ANNOUNCE_CHANNEL_ID, WORDLE_ROLE_ID).
*/

#pragma once
#include <string>
#include <iostream>
#include <cstdint>
#include <boost/optional.hpp>
#include "timezone.hpp"

struct Config {
    std::string dict_path;
    std::string state_path;
    std::string timezone;
    std::string tz_database;  // Boost zone CSV, needed for region names
    std::string bot_token;    // empty: announce on stdout
    std::string api_base;
    uint64_t channel_id;
    uint64_t role_id;
    double alpha;
    std::string log_level;
    int print_top;            // > 0: print the hardest words and exit
    bool no_stdin;            // don't read commands from stdin, wait for a signal

    Config();

    // throws Config_error
    Timezone make_timezone() const;

    static void test();
};

// boost::none if --help was given, the usage text is then written to [usage].
// Throws Config_error.
boost::optional<Config> parse_config(int argc, const char* const argv[], bool use_environment, std::ostream& usage);

#include <map>
#include <cmath>
#include <fstream>
#include <sstream>
#include <cstdio>
#include <boost/program_options.hpp>
#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"

using std::string;

namespace po = boost::program_options;

Config::Config() :
    api_base("https://discord.com/api/v10"),
    channel_id(0),
    role_id(0),
    alpha(2.0),
    log_level("info"),
    print_top(0),
    no_stdin(false)
{}

Timezone Config::make_timezone() const {
    if (tz_database.empty()) return Timezone(timezone);
    return Timezone(timezone, tz_database);
}

static string option_of_env(const string& env) {
    static const std::map<string, string> names = {
        { "DICT_PATH",             "dict-path" },
        { "STATE_PATH",            "state-path" },
        { "TIMEZONE",              "timezone" },
        { "TZ_DATABASE",           "tz-database" },
        { "DISCORD_BOT_TOKEN",     "bot-token" },
        { "ANNOUNCE_CHANNEL_ID",   "announce-channel-id" },
        { "WORDLE_ROLE_ID",        "role-id" },
        { "WORDSTARTER_API_BASE",  "api-base" },
        { "WORDSTARTER_LOG_LEVEL", "log-level" },
    };
    auto it = names.find(env);
    return it == names.end() ? string() : it->second;
}

boost::optional<Config> parse_config(int argc, const char* const argv[], bool use_environment, std::ostream& usage) {
    Config c;
    string config_file;

    po::options_description desc("Pick and announce one hard five-letter word per day");
    desc.add_options()
        ("dict-path,d",         po::value<string>(&c.dict_path)->required(),                  "word list, one word per line")
        ("state-path,s",        po::value<string>(&c.state_path)->required(),                 "JSON state snapshot")
        ("timezone,t",          po::value<string>(&c.timezone)->required(),                   "POSIX TZ spec (Boost sign convention), or a region name with --tz-database")
        ("tz-database",         po::value<string>(&c.tz_database),                            "Boost date_time_zonespec.csv")
        ("bot-token",           po::value<string>(&c.bot_token),                              "chat bot token, announcements go to stdout without it")
        ("api-base",            po::value<string>(&c.api_base)->default_value(c.api_base),    "chat API base URL")
        ("announce-channel-id", po::value<uint64_t>(&c.channel_id)->default_value(0),         "channel for announcements")
        ("role-id",             po::value<uint64_t>(&c.role_id)->default_value(0),            "role to mention, 0 for none")
        ("alpha,a",             po::value<double>(&c.alpha)->default_value(2.0),              "sampler sharpness, higher favors harder words")
        ("log-level",           po::value<string>(&c.log_level)->default_value("info"),       "info, warn, error or off")
        ("print-top",           po::value<int>(&c.print_top)->default_value(0),               "print the N hardest words and exit")
        ("no-stdin",            po::bool_switch(&c.no_stdin),                                 "ignore stdin, run until SIGINT/SIGTERM")
        ("config,c",            po::value<string>(&config_file),                              "INI file with any of these options")
        ("help,h",                                                                            "produce help message");

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
        if (use_environment) {
            po::store(po::parse_environment(desc, option_of_env), vm);
        }
        if (vm.count("help")) {
            usage << desc << std::endl;
            return boost::none;
        }
        if (vm.count("config")) {
            const string file = vm["config"].as<string>();
            std::ifstream ifs(file.c_str());
            if (!ifs.is_open()) throw Config_error("Can't open config file: " + file);
            po::store(po::parse_config_file(ifs, desc), vm);
        }
        po::notify(vm);
    } catch (const po::error& e) {
        throw Config_error(e.what());
    }

    if (!std::isfinite(c.alpha) || c.alpha <= 0) {
        throw Config_error("alpha must be a positive number");
    }
    try {
        Log::level_of_string(c.log_level);
    } catch (const std::runtime_error&) {
        throw Config_error("Unknown log level: " + c.log_level);
    }
    if (!c.bot_token.empty() && c.channel_id == 0) {
        throw Config_error("bot-token needs announce-channel-id");
    }
    if (c.print_top < 0) {
        throw Config_error("print-top can't be negative");
    }
    return c;
}

void Config::test() {
    std::stringstream usage;

    {
        const char* argv[] = { "wordstarter", "-d", "words.txt", "--state-path", "/var/lib/ws/state.json",
                               "--timezone", "CET+01CEST,M3.5.0/02:00,M10.5.0/03:00", "--role-id", "77", "--no-stdin" };
        boost::optional<Config> c = parse_config(10, argv, false, usage);
        std::stringstream output;
        output << c->dict_path << " " << c->state_path << " " << c->role_id << " " << c->channel_id << " "
               << c->alpha << " " << c->log_level << " " << c->no_stdin << " " << c->bot_token.empty() << " "
               << c->make_timezone().local_date(boost::posix_time::time_from_string("2025-06-30 22:30:00"));
        std::string expected = "words.txt /var/lib/ws/state.json 77 0 2 info 1 1 2025-Jul-01";
        if (output.str() != expected) {
            throw std::runtime_error("Config::test() 1 failed, got " + output.str() + ", but expected " + expected);
        }
    }

    {
        const char* argv[] = { "wordstarter", "--help" };
        if (parse_config(2, argv, false, usage) || usage.str().find("--dict-path") == string::npos) {
            throw std::runtime_error("Config::test() 2 failed, --help should print usage and return none");
        }
    }

    const char* bad[][8] = {
        { "wordstarter", "-d", "w", "-s", "s", nullptr },                               // no timezone
        { "wordstarter", "-d", "w", "-s", "s", "-t", "UTC+00", "--alpha=-1" },
        { "wordstarter", "-d", "w", "-s", "s", "-t", "UTC+00", "--log-level=loud" },
        { "wordstarter", "-d", "w", "-s", "s", "-t", "UTC+00", "--bot-token=abc" },     // no channel
        { "wordstarter", "-d", "w", "-s", "s", "-t", "UTC+00", "--frobnicate" },
        { "wordstarter", "-d", "w", "-s", "s", "-t", "UTC+00", "--config=/nonexistent/ws.ini" },
    };
    for (const auto& argv : bad) {
        int argc = 0;
        while (argc < 8 && argv[argc]) argc++;
        bool threw = false;
        try {
            parse_config(argc, argv, false, usage);
        } catch (const Config_error&) {
            threw = true;
        }
        if (!threw) throw std::runtime_error(string("Config::test() 3 failed, accepted ") + argv[argc - 1]);
    }

    // command line beats the file
    const string ini = "/tmp/wordstarter-config-test.ini";
    {
        std::ofstream f(ini.c_str());
        f << "dict-path = /srv/words.txt\n"
          << "state-path = /srv/state.json\n"
          << "timezone = UTC+00\n"
          << "alpha = 3.5\n"
          << "role-id = 12\n";
    }
    const char* argv[] = { "wordstarter", "--config", ini.c_str(), "--role-id", "99" };
    boost::optional<Config> c;
    try {
        c = parse_config(5, argv, false, usage);
    } catch (const Config_error& e) {
        std::remove(ini.c_str());
        throw std::runtime_error(string("Config::test() 4 failed: ") + e.what());
    }
    std::remove(ini.c_str());
    std::stringstream output;
    output << c->dict_path << " " << c->alpha << " " << c->role_id;
    if (output.str() != "/srv/words.txt 3.5 99") {
        throw std::runtime_error("Config::test() 4 failed, got " + output.str());
    }
}

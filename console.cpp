#include <sstream>
#include <boost/lexical_cast.hpp>
#include "console.hpp"
#include "commands.hpp"
#include "log.hpp"

using std::string;
using boost::posix_time::ptime;

static const char* usage_text =
    "suggest <user id> <word>   queue a word for a future day\n"
    "history [days]             words of the last days (default 14)\n"
    "run                        run the daily cycle now\n"
    "quit                       stop";

Console::Console(State::Store& store_, const Lexicon& lexicon_, const Timezone& tz_, Scheduler::Daily_scheduler& scheduler_) :
    store(store_), lexicon(lexicon_), tz(tz_), scheduler(scheduler_) {}

string Console::handle(const string& line, const ptime& utc_now, bool& quit) {
    std::istringstream ss(line);
    string cmd;
    ss >> cmd;
    quit = false;

    if (cmd.empty()) return string();

    if (cmd == "quit" || cmd == "exit") {
        quit = true;
        return "bye";
    }
    if (cmd == "help") return usage_text;

    if (cmd == "suggest") {
        string id_str;
        string word;
        string extra;
        ss >> id_str >> word;
        if (word.empty() || (ss >> extra)) return "usage: suggest <user id> <word>";
        State::User_id id;
        try {
            if (id_str.find_first_not_of("0123456789") != string::npos) throw boost::bad_lexical_cast();
            id = boost::lexical_cast<State::User_id>(id_str);
        } catch (const boost::bad_lexical_cast&) {
            return "usage: suggest <user id> <word>";
        }
        return Commands::submit_suggestion(store, lexicon, id, word).message();
    }

    if (cmd == "history") {
        int days = Commands::default_days_back;
        string arg;
        if (ss >> arg) {
            try {
                days = boost::lexical_cast<int>(arg);
            } catch (const boost::bad_lexical_cast&) {
                return "usage: history [days]";
            }
        }
        return Commands::query_history(store, tz, utc_now, days).render();
    }

    if (cmd == "run") {
        return scheduler.run_cycle_logged(utc_now) ? "cycle done" : "cycle failed, see log";
    }

    return "Unknown command: " + cmd + "\n" + usage_text;
}

void Console::run(std::istream& in, std::ostream& out) {
    string line;
    bool quit = false;
    while (!quit && std::getline(in, line)) {
        string reply = handle(line, boost::posix_time::microsec_clock::universal_time(), quit);
        if (!reply.empty()) out << reply << std::endl;
    }
}

void Console::test() {
    Log::Level saved_level = Log::get_level();
    Log::set_level(Log::Level::off);

    Lexicon lex = Lexicon::of_scores({{"crane", 5.0}, {"fjord", 1.0}});
    State::Store store("");
    Timezone utc = Timezone::utc();
    Notify::Recording_notifier rn;
    Sampler::Sequence_random rng({0.0});
    Scheduler::Daily_scheduler sched(store, lex, utc, rn, rng);
    Console console(store, lex, utc, sched);

    std::stringstream in;
    in << "suggest 12 Crane\n"
       << "suggest 12 crane\n"
       << "suggest twelve crane\n"
       << "suggest 12\n"
       << "\n"
       << "history\n"
       << "run\n"
       << "history 3\n"
       << "history soon\n"
       << "quit\n"
       << "suggest 13 fjord\n";
    std::stringstream out;
    console.run(in, out);
    Log::set_level(saved_level);

    std::string expected =
        "Queued `crane`.\n"
        "Already queued.\n"
        "usage: suggest <user id> <word>\n"
        "usage: suggest <user id> <word>\n"
        "No entries in the last 14 days.\n"
        "cycle done\n"
        "Previous starting words for the last 3 days\n"
        "2025-05-11 — `crane`\n\n"
        "usage: history [days]\n"
        "bye\n";
    // the history line depends on today's date, patch it in
    ptime now = boost::posix_time::microsec_clock::universal_time();
    string tomorrow = boost::gregorian::to_iso_extended_string(utc.local_date(now) + boost::gregorian::days(1));
    expected.replace(expected.find("2025-05-11"), 10, tomorrow);

    if (out.str() != expected) {
        throw std::runtime_error("Console::test() failed, got\n" + out.str() + "but expected\n" + expected);
    }
    if (rn.count() != 1 || rn.get_announcements()[0].suggested_by != State::User_id(12)) {
        throw std::runtime_error("Console::test() failed, run should announce the queued crane");
    }
}

/* Line commands on stdin, the local stand-in for chat slash commands:

       suggest <user id> <word>
       history [days]
       run                       one cycle now
       help
       quit
*/

#pragma once
#include <string>
#include <iostream>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "store.hpp"
#include "lexicon.hpp"
#include "timezone.hpp"
#include "scheduler.hpp"

class Console {
public:
    Console(State::Store& store, const Lexicon& lexicon, const Timezone& tz, Scheduler::Daily_scheduler& scheduler);

    // the reply to one command line; [quit] is set by quit/exit
    std::string handle(const std::string& line, const boost::posix_time::ptime& utc_now, bool& quit);

    // until EOF or quit
    void run(std::istream& in, std::ostream& out);

    static void test();
private:
    State::Store& store;
    const Lexicon& lexicon;
    const Timezone& tz;
    Scheduler::Daily_scheduler& scheduler;
};

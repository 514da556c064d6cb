#include <iostream>
#include <stdexcept>
#include <curl/curl.h>
#include "log.hpp"
#include "word.hpp"
#include "scorer.hpp"
#include "lexicon.hpp"
#include "sampler.hpp"
#include "state.hpp"
#include "store.hpp"
#include "timezone.hpp"
#include "notifier.hpp"
#include "commands.hpp"
#include "scheduler.hpp"
#include "config.hpp"
#include "console.hpp"

int main() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    try {
        Log::test();
        Word::test();
        Scoring::test();
        Lexicon::test();
        Sampler::test();
        State::Bot_state::test();
        State::Store::test();
        Timezone::test();
        Notify::test();
        Commands::test();
        Scheduler::Daily_scheduler::test();
        Config::test();
        Console::test();
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        curl_global_cleanup();
        return 1;
    }
    curl_global_cleanup();
    std::cout << "All tests passed" << std::endl;
    return 0;
}

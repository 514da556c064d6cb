#include <string>
#include <vector>
#include <memory>
#include <iomanip>
#include <iostream>
#include <csignal>
#include <pthread.h>
#include <curl/curl.h>
#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "lexicon.hpp"
#include "store.hpp"
#include "sampler.hpp"
#include "notifier.hpp"
#include "scheduler.hpp"
#include "console.hpp"

using std::string;
using std::vector;
using std::pair;
using std::cout;
using std::endl;

static void print_top(const Lexicon& lexicon, int n) {
    vector<pair<string, double>> top = lexicon.top(n, true);
    for (size_t i = 0; i < top.size(); i++) {
        cout << std::setw(3) << (i + 1) << ". "
             << std::setw(8) << std::fixed << std::setprecision(3) << top[i].second << "  "
             << top[i].first << endl;
    }
}

// blocks SIGINT/SIGTERM in the calling thread and every thread started after it
static sigset_t block_stop_signals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0) throw std::runtime_error("pthread_sigmask failed");
    return set;
}

int main(int argc, char* argv[]) {
    boost::optional<Config> cfg;
    try {
        cfg = parse_config(argc, argv, true, std::cerr);
    } catch (const Config_error& e) {
        std::cerr << "wordstarter: " << e.what() << endl << "Try --help" << endl;
        return 2;
    }
    if (!cfg) return 1;
    Log::set_level(Log::level_of_string(cfg->log_level));

    try {
        Lexicon lexicon = Lexicon::of_file(cfg->dict_path);
        if (cfg->print_top > 0) {
            print_top(lexicon, cfg->print_top);
            return 0;
        }

        Timezone tz = cfg->make_timezone();
        State::Store store(cfg->state_path);
        store.load();

        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("curl_global_init failed");
        }
        std::shared_ptr<Notify::Notifier_intf> notifier_ptr;
        if (cfg->bot_token.empty()) {
            Log::info() << "No bot token, announcing on stdout";
            notifier_ptr = std::make_shared<Notify::Stream_notifier>(cout, cfg->role_id);
        } else {
            notifier_ptr = std::make_shared<Notify::Http_notifier>(cfg->api_base, cfg->bot_token, cfg->channel_id, cfg->role_id);
        }

        Sampler::System_random rng;
        Scheduler::Daily_scheduler scheduler(store, lexicon, tz, *notifier_ptr, rng, cfg->alpha);

        if (cfg->no_stdin) {
            sigset_t stop_signals = block_stop_signals();
            scheduler.start();
            int sig = 0;
            sigwait(&stop_signals, &sig);
            Log::info() << "Got signal " << sig << ", stopping";
        } else {
            scheduler.start();
            Console console(store, lexicon, tz, scheduler);
            console.run(std::cin, cout);
        }
        scheduler.stop();
        curl_global_cleanup();
    } catch (const Config_error& e) {
        Log::error() << "Bad configuration: " << e.what();
        return 1;
    } catch (const Lexicon_load_error& e) {
        Log::error() << "Can't load the word list: " << e.what();
        return 1;
    } catch (const State_load_error& e) {
        Log::error() << "Can't load the state: " << e.what();
        return 1;
    } catch (const std::exception& e) {
        Log::error() << "Fatal: " << e.what();
        return 1;
    }
    return 0;
}

#include <set>
#include <sstream>
#include <boost/thread/lock_guard.hpp>
#include "scheduler.hpp"
#include "errors.hpp"
#include "log.hpp"

using std::string;
using std::set;
using boost::gregorian::date;
using boost::posix_time::ptime;
using boost::posix_time::microsec_clock;
using State::Bot_state;
using State::Used_entry;
using State::Queued_suggestion;
using State::User_id;

namespace Scheduler {
    std::ostream& operator<<(std::ostream& os, Source s) {
        switch (s) {
        case Source::reused:  return os << "reused";
        case Source::queue:   return os << "queue";
        case Source::sampler: return os << "sampler";
        }
        return os;
    }

    Daily_scheduler::Daily_scheduler(State::Store& store_, const Lexicon& lexicon_, const Timezone& tz_,
                                     Notify::Notifier_intf& notifier_, Sampler::Random_source& rng_, double alpha_) :
        store(store_),
        lexicon(lexicon_),
        tz(tz_),
        notifier(notifier_),
        rng(rng_),
        alpha(alpha_),
        stopping(false)
    {}

    Daily_scheduler::~Daily_scheduler() {
        stop();
    }

    boost::optional<Cycle_result> Daily_scheduler::reuse(const date& target) {
        return store.with_read([&target] (const Bot_state& s) -> boost::optional<Cycle_result> {
            const Used_entry* e = s.find_entry(target);
            if (!e) return boost::none;
            Cycle_result r;
            r.target = target;
            r.word = e->word;
            r.suggested_by = e->suggested_by;
            r.source = Source::reused;
            return r;
        });
    }

    boost::optional<Cycle_result> Daily_scheduler::drain_queue(const date& target) {
        struct Step {
            bool empty;
            bool accepted;
            Queued_suggestion q;
        };
        const Lexicon& lex = lexicon;

        for (;;) {
            if (store.with_read([] (const Bot_state& s) { return s.queue.empty(); })) return boost::none;

            Step step = store.with_write([&target, &lex] (Bot_state& s) -> Step {
                Step st = Step();
                st.empty = s.queue.empty();
                st.accepted = false;
                if (st.empty) return st;
                st.q = s.queue.front();
                s.queue.pop_front();
                st.q.word = Word::normalize(st.q.word);
                if (lex.contains(st.q.word) && !s.is_used(st.q.word)) {
                    s.mark_used(target, st.q.word, st.q.submitter);
                    st.accepted = true;
                }
                return st;
            });
            if (step.empty) return boost::none;
            if (step.accepted) {
                Cycle_result r;
                r.target = target;
                r.word = step.q.word;
                r.suggested_by = step.q.submitter;
                r.source = Source::queue;
                return r;
            }
            // TODO: tell the submitter their word was dropped once there is a direct-message channel
            Log::info() << "Dropped queued suggestion " << step.q.word << " from " << step.q.submitter
                        << ", not in the lexicon or already used";
        }
    }

    Cycle_result Daily_scheduler::sample(const date& target) {
        set<string> used = store.with_read([] (const Bot_state& s) { return s.used; });
        boost::optional<string> w = Sampler::pick_weighted(lexicon, used, alpha, rng);
        if (!w) {
            throw No_candidate_error("No unused word left for " + boost::gregorian::to_iso_extended_string(target)
                                     + " (" + std::to_string(used.size()) + " used)");
        }
        const string word = *w;
        store.with_write([&target, &word] (Bot_state& s) { s.mark_used(target, word, boost::none); });

        Cycle_result r;
        r.target = target;
        r.word = word;
        r.source = Source::sampler;
        return r;
    }

    Cycle_result Daily_scheduler::run_cycle(const ptime& utc_now) {
        boost::lock_guard<boost::mutex> lock(cycle_mutex);
        const date target = tz.local_date(utc_now) + boost::gregorian::days(1);

        boost::optional<Cycle_result> r = reuse(target);
        if (!r) r = drain_queue(target);
        if (!r) r = sample(target);

        Log::info() << "Word for " << boost::gregorian::to_iso_extended_string(target) << " is " << r->word
                    << " (" << r->source << ")";
        notifier.announce(r->target, r->word, r->suggested_by);
        return *r;
    }

    bool Daily_scheduler::run_cycle_logged(const ptime& utc_now) {
        try {
            run_cycle(utc_now);
            return true;
        } catch (const No_candidate_error& e) {
            Log::error() << "Cycle failed: " << e.what();
        } catch (const Notification_error& e) {
            Log::error() << "Announcement failed, the next cycle will retry: " << e.what();
        } catch (const std::exception& e) {
            Log::error() << "Cycle failed: " << e.what();
        }
        return false;
    }

    ptime Daily_scheduler::next_wake(const ptime& utc_now) const {
        return tz.next_occurrence(utc_now, daily_at);
    }

    void Daily_scheduler::start() {
        boost::lock_guard<boost::mutex> lock(wake_mutex);
        if (worker.joinable()) {
            throw std::runtime_error("Daily_scheduler::start() called twice");
        }
        stopping = false;
        worker = boost::thread(&Daily_scheduler::run_loop, this);
    }

    void Daily_scheduler::stop() {
        {
            boost::lock_guard<boost::mutex> lock(wake_mutex);
            stopping = true;
        }
        wake_cv.notify_all();
        if (worker.joinable()) worker.join();
    }

    bool Daily_scheduler::is_running() const {
        boost::lock_guard<boost::mutex> lock(wake_mutex);
        return worker.joinable() && !stopping;
    }

    void Daily_scheduler::run_loop() {
        Log::info() << "Scheduler started, timezone " << tz.get_name();
        for (;;) {
            {
                boost::lock_guard<boost::mutex> lock(wake_mutex);
                if (stopping) break;
            }
            run_cycle_logged(microsec_clock::universal_time());

            ptime wake = next_wake(microsec_clock::universal_time());
            Log::info() << "Next cycle at " << wake << " UTC";

            boost::unique_lock<boost::mutex> lock(wake_mutex);
            while (!stopping && microsec_clock::universal_time() < wake) {
                wake_cv.timed_wait(lock, wake);
            }
            if (stopping) break;
        }
        Log::info() << "Scheduler stopped";
    }

    //////////////////
    // tests

    // counts draws, and fails the test if it's used when it shouldn't be
    class Counting_random : public Sampler::Random_source {
    public:
        Counting_random(double v) : value(v), calls(0) {}
        virtual double uniform() { calls++; return value; }
        double value;
        int calls;
    };

    static void check(bool ok, int n, const string& what) {
        if (!ok) throw std::runtime_error("Daily_scheduler::test() " + std::to_string(n) + " failed, " + what);
    }

    void Daily_scheduler::test() {
        Log::Level saved_level = Log::get_level();
        Log::set_level(Log::Level::off);
        struct Restore {
            Log::Level level;
            ~Restore() { Log::set_level(level); }
        } restore = { saved_level };

        // crane is the hardest by far, a draw of 0.5 lands on it whenever it's unused
        const Lexicon lex = Lexicon::of_scores({{"crane", 30.0}, {"fjord", 1.0}, {"nymph", 1.0}, {"abcde", 0.5}});
        const Timezone utc = Timezone::utc();
        const ptime now = boost::posix_time::time_from_string("2025-05-10 12:00:00");
        const date tomorrow(2025, 5, 11);

        // 1. reuse: tomorrow already has a word
        {
            State::Store store("");
            store.with_write([&tomorrow] (Bot_state& s) {
                s.mark_used(tomorrow, "fjord", User_id(5));
                s.queue.push_back({6, "nymph"});
            });
            Notify::Recording_notifier rn;
            Counting_random rng(0.5);
            Daily_scheduler sched(store, lex, utc, rn, rng);
            Cycle_result r = sched.run_cycle(now);
            size_t queued = store.with_read([] (const Bot_state& s) { return s.queue.size(); });
            size_t history = store.with_read([] (const Bot_state& s) { return s.history.size(); });
            check(r.source == Source::reused && r.word == "fjord" && r.suggested_by == User_id(5), 1, "did not reuse fjord");
            check(queued == 1 && history == 1 && rng.calls == 0, 1, "reuse touched the queue or the sampler");
            check(rn.count() == 1 && rn.get_announcements()[0].suggested_by == User_id(5)
                  && rn.get_announcements()[0].date == tomorrow, 1, "reused word not announced with its suggester");
        }

        // 2. a valid queued word beats the sampler
        {
            State::Store store("");
            store.with_write([] (Bot_state& s) { s.queue.push_back({9, "nymph"}); });
            Notify::Recording_notifier rn;
            Counting_random rng(0.5);
            Daily_scheduler sched(store, lex, utc, rn, rng);
            Cycle_result r = sched.run_cycle(now);
            Bot_state s = store.with_read([] (const Bot_state& st) { return st; });
            check(r.source == Source::queue && r.word == "nymph" && r.suggested_by == User_id(9), 2, "queued word not picked");
            check(s.queue.empty() && s.is_used("nymph") && s.history.size() == 1
                  && s.history[0].date == tomorrow && rng.calls == 0, 2, "queue pick not recorded");
        }

        // 3. invalid entries are dropped, entries behind the accepted one wait
        {
            State::Store store("");
            store.with_write([] (Bot_state& s) {
                s.mark_used(date(2025, 1, 1), "fjord", boost::none);
                s.queue.push_back({1, "zzzzz"});  // not in the lexicon
                s.queue.push_back({2, "fjord"});  // used
                s.queue.push_back({3, "NyMpH"});
                s.queue.push_back({4, "abcde"});
            });
            Notify::Recording_notifier rn;
            Counting_random rng(0.5);
            Daily_scheduler sched(store, lex, utc, rn, rng);
            Cycle_result r = sched.run_cycle(now);
            Bot_state s = store.with_read([] (const Bot_state& st) { return st; });
            check(r.word == "nymph" && r.suggested_by == User_id(3), 3, "expected nymph from 3, got " + r.word);
            check(s.queue.size() == 1 && s.queue.front().word == "abcde" && rng.calls == 0, 3, "queue not drained up to the pick");
        }

        // 3b. a queue of only dropped entries drains to empty and falls through to the sampler
        {
            State::Store store("");
            store.with_write([] (Bot_state& s) {
                s.queue.push_back({1, "zzzzz"});
                s.queue.push_back({2, "not a word"});
            });
            Notify::Recording_notifier rn;
            Counting_random rng(0.5);
            Daily_scheduler sched(store, lex, utc, rn, rng);
            Cycle_result r = sched.run_cycle(now);
            Bot_state s = store.with_read([] (const Bot_state& st) { return st; });
            check(r.source == Source::sampler && !r.suggested_by && r.word == "crane", 3, "expected an unattributed sampler pick, got " + r.word);
            check(s.queue.empty() && rng.calls == 1, 3, "dropped entries left in the queue");
        }

        // 4. sampler fallback skips used words, attributes nobody
        {
            State::Store store("");
            store.with_write([] (Bot_state& s) {
                s.mark_used(date(2025, 1, 1), "crane", boost::none);
                s.queue.push_back({1, "crane"});
            });
            Notify::Recording_notifier rn;
            Counting_random rng(0.5);
            Daily_scheduler sched(store, lex, utc, rn, rng);
            Cycle_result r = sched.run_cycle(now);
            Bot_state s = store.with_read([] (const Bot_state& st) { return st; });
            check(r.source == Source::sampler && r.word != "crane" && !r.suggested_by && rng.calls == 1, 4,
                  "sampler fallback picked " + r.word);
            check(s.queue.empty() && s.is_used(r.word) && s.history.back().word == r.word, 4, "sampler pick not recorded");
        }

        // 5. lexicon exhausted: the cycle fails, nothing changes
        {
            State::Store store("");
            store.with_write([] (Bot_state& s) {
                const char* all[] = { "crane", "fjord", "nymph", "abcde" };
                for (const char* w : all) s.mark_used(date(2024, 1, 1), w, boost::none);
            });
            Notify::Recording_notifier rn;
            Counting_random rng(0.5);
            Daily_scheduler sched(store, lex, utc, rn, rng);
            bool threw = false;
            try {
                sched.run_cycle(now);
            } catch (const No_candidate_error&) {
                threw = true;
            }
            size_t history = store.with_read([] (const Bot_state& s) { return s.history.size(); });
            check(threw && history == 4 && rn.count() == 0, 5, "exhausted lexicon did not fail the cycle");
            check(!sched.run_cycle_logged(now), 5, "run_cycle_logged should report the failure");
        }

        // 6. failed announcement: the word stays, the next cycle announces the same one
        {
            State::Store store("");
            Notify::Recording_notifier rn;
            Counting_random rng(0.5);
            Daily_scheduler sched(store, lex, utc, rn, rng);
            rn.fail_next(1);
            bool threw = false;
            try {
                sched.run_cycle(now);
            } catch (const Notification_error&) {
                threw = true;
            }
            Cycle_result again = sched.run_cycle(now);
            Cycle_result third = sched.run_cycle(now + boost::posix_time::hours(6));
            size_t history = store.with_read([] (const Bot_state& s) { return s.history.size(); });
            check(threw && again.source == Source::reused && again.word == "crane", 6, "retry did not reuse the word");
            check(third.word == "crane" && history == 1 && rn.count() == 2 && rng.calls == 1, 6, "same day picked twice");
        }

        // 7. the next day gets a new word, and the wake-up time is today's or tomorrow's 23:55
        {
            State::Store store("");
            Notify::Recording_notifier rn;
            Counting_random rng(0.5);
            Daily_scheduler sched(store, lex, utc, rn, rng);
            Cycle_result d1 = sched.run_cycle(now);
            Cycle_result d2 = sched.run_cycle(now + boost::posix_time::hours(24));
            check(d1.word != d2.word && d2.target == d1.target + boost::gregorian::days(1), 7, "consecutive days repeated a word");

            std::stringstream output;
            output << sched.next_wake(now) << "," << sched.next_wake(boost::posix_time::time_from_string("2025-05-10 23:56:00"));
            check(output.str() == "2025-May-10 23:55:00,2025-May-11 23:55:00", 7, "wrong wake times " + output.str());
        }

        // 8. the background loop runs a cycle right away and stops on request
        {
            State::Store store("");
            Notify::Recording_notifier rn;
            Counting_random rng(0.5);
            Daily_scheduler sched(store, lex, utc, rn, rng);
            sched.start();
            ptime deadline = microsec_clock::universal_time() + boost::posix_time::seconds(10);
            while (rn.count() == 0 && microsec_clock::universal_time() < deadline) {
                boost::this_thread::sleep(boost::posix_time::milliseconds(10));
            }
            check(sched.is_running(), 8, "loop not running");
            sched.stop();
            check(rn.count() == 1 && !sched.is_running(), 8, "loop did not run exactly one cycle before stopping");
        }
    }
}

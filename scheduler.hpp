/* The once-a-day cycle. Each cycle makes sure tomorrow (local date) has a word and
   announces it:

     1. tomorrow already has a history entry -> announce that one again
     2. otherwise pop suggestions until one is in the lexicon and unused, take it
     3. otherwise draw a word with Sampler::pick_weighted
     4. announce

   Step 1 makes a cycle safe to repeat: a cycle that picked a word but failed to
   announce it is fixed by the next one. The background loop runs a cycle at start
   and then every day at 23:55 local time until stop().
*/

#pragma once
#include <string>
#include <boost/optional.hpp>
#include <boost/thread/thread.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "store.hpp"
#include "lexicon.hpp"
#include "sampler.hpp"
#include "timezone.hpp"
#include "notifier.hpp"

namespace Scheduler {
    enum class Source
        { reused,
          queue,
          sampler };

    struct Cycle_result {
        boost::gregorian::date target;
        std::string word;
        boost::optional<State::User_id> suggested_by;
        Source source;
    };

    // local wall clock time of the daily cycle
    const boost::posix_time::time_duration daily_at = boost::posix_time::hours(23) + boost::posix_time::minutes(55);

    class Daily_scheduler {
    public:
        Daily_scheduler(State::Store& store,
                        const Lexicon& lexicon,
                        const Timezone& tz,
                        Notify::Notifier_intf& notifier,
                        Sampler::Random_source& rng,
                        double alpha = Sampler::default_alpha);
        ~Daily_scheduler();

        // One cycle targeting the day after the local date of [utc_now].
        // Throws No_candidate_error and Notification_error; a word picked before a
        // failed announcement stays used.
        Cycle_result run_cycle(const boost::posix_time::ptime& utc_now);

        // run_cycle, with failures logged instead of thrown. False if the cycle failed.
        bool run_cycle_logged(const boost::posix_time::ptime& utc_now);

        boost::posix_time::ptime next_wake(const boost::posix_time::ptime& utc_now) const;

        // background loop, stop() wakes it up and waits for it
        void start();
        void stop();
        bool is_running() const;

        static void test();
    private:
        boost::optional<Cycle_result> reuse(const boost::gregorian::date& target);
        boost::optional<Cycle_result> drain_queue(const boost::gregorian::date& target);
        Cycle_result sample(const boost::gregorian::date& target);
        void run_loop();

        State::Store& store;
        const Lexicon& lexicon;
        const Timezone& tz;
        Notify::Notifier_intf& notifier;
        Sampler::Random_source& rng;
        double alpha;

        boost::mutex cycle_mutex; // one cycle at a time, also guards rng

        mutable boost::mutex wake_mutex;
        boost::condition_variable wake_cv;
        bool stopping;
        boost::thread worker;
    };

    std::ostream& operator<<(std::ostream& os, Source s);
}

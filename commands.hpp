/* The two things users can ask for: queue a word for a future day, and list the
   words of the last few days. Both answer with text ready to send back.
*/

#pragma once
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "state.hpp"
#include "store.hpp"
#include "lexicon.hpp"
#include "timezone.hpp"

namespace Commands {
    enum class Rejection
        { none,
          invalid_format,  // not 5 letters a-z after trimming and lowercasing
          not_in_lexicon,
          already_used,
          already_queued };

    struct Suggestion_result {
        Rejection reason;
        std::string word; // normalized

        bool accepted() const { return reason == Rejection::none; }
        std::string message() const;
    };

    // Checks run in the order of Rejection. Accepted words go to the back of the queue.
    Suggestion_result submit_suggestion(State::Store& store,
                                        const Lexicon& lexicon,
                                        State::User_id submitter,
                                        const std::string& raw_word);

    const int default_days_back = 14;
    const int max_days_back = 3650;
    const size_t history_budget = 1900;

    struct History_report {
        int days;
        std::vector<State::Used_entry> rows; // newest first, then by word

        bool empty() const { return rows.empty(); }
        // header plus as many rows as fit in [budget] bytes
        std::string render(size_t budget = history_budget) const;
    };

    // [days_back] is clamped to [1, 3650]. Entries dated on or after (today - days_back),
    // today being the local date of [utc_now].
    History_report query_history(const State::Store& store,
                                 const Timezone& tz,
                                 const boost::posix_time::ptime& utc_now,
                                 int days_back = default_days_back);

    std::ostream& operator<<(std::ostream& os, Rejection r);

    void test();
}

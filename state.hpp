/* Everything the daemon remembers between runs: which words were used, on which
   date, who suggested them, and the suggestions still waiting their turn.

   Snapshot format (JSON):

       { "used":    [ "crane", ... ],
         "history": [ { "date": "2025-01-31", "word": "crane", "suggested_by": "1234" }, ... ],
         "queue":   [ [ "1234", "nymph" ], ... ] }

   suggested_by is null for sampler picks. Ids are written as strings and
   read back from strings or numbers.
*/

#pragma once
#include <set>
#include <deque>
#include <vector>
#include <string>
#include <cstdint>
#include <boost/optional.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <json/json.h>

namespace State {
    typedef uint64_t User_id;

    struct Used_entry {
        boost::gregorian::date date;
        std::string word;
        boost::optional<User_id> suggested_by;

        bool operator==(const Used_entry& r) const;
    };

    struct Queued_suggestion {
        User_id submitter;
        std::string word;

        bool operator==(const Queued_suggestion& r) const;
    };

    class Bot_state {
    public:
        std::set<std::string> used;
        std::vector<Used_entry> history; // insertion order
        std::deque<Queued_suggestion> queue;

        // every word in history is also in used, keep it that way
        void mark_used(const boost::gregorian::date& date,
                       const std::string& word,
                       const boost::optional<User_id>& suggested_by);

        // the latest history entry for [date], or nullptr
        const Used_entry* find_entry(const boost::gregorian::date& date) const;

        bool is_used(const std::string& word) const;
        bool is_queued(const std::string& word) const;

        Json::Value to_json() const;
        std::string to_string() const;
        // both throw State_load_error
        static Bot_state of_json(const Json::Value& v);
        static Bot_state of_string(const std::string& r);

        bool operator==(const Bot_state& r) const;

        static void test();
    };
}

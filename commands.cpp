#include <sstream>
#include <algorithm>
#include "commands.hpp"
#include "log.hpp"

using std::string;
using std::vector;
using boost::gregorian::date;
using boost::posix_time::ptime;
using State::Bot_state;
using State::Used_entry;
using State::User_id;

namespace Commands {
    std::ostream& operator<<(std::ostream& os, Rejection r) {
        switch (r) {
        case Rejection::none:           return os << "accepted";
        case Rejection::invalid_format: return os << "invalid_format";
        case Rejection::not_in_lexicon: return os << "not_in_lexicon";
        case Rejection::already_used:   return os << "already_used";
        case Rejection::already_queued: return os << "already_queued";
        }
        return os;
    }

    string Suggestion_result::message() const {
        switch (reason) {
        case Rejection::none:           return "Queued `" + word + "`.";
        case Rejection::invalid_format: return "Rejected: provide a 5-letter a–z word.";
        case Rejection::not_in_lexicon: return "Rejected: not in dictionary.";
        case Rejection::already_used:   return "Rejected: already used previously.";
        case Rejection::already_queued: return "Already queued.";
        }
        return string();
    }

    static Rejection check_state(const Bot_state& s, const string& w) {
        if (s.is_used(w)) return Rejection::already_used;
        if (s.is_queued(w)) return Rejection::already_queued;
        return Rejection::none;
    }

    Suggestion_result submit_suggestion(State::Store& store, const Lexicon& lexicon,
                                        User_id submitter, const string& raw_word) {
        Suggestion_result r;
        r.word = Word::normalize(raw_word);
        r.reason = Rejection::none;

        if (!Word::is_valid(r.word)) {
            r.reason = Rejection::invalid_format;
        } else if (!lexicon.contains(r.word)) {
            r.reason = Rejection::not_in_lexicon;
        } else {
            // most rejections never need the write lock
            r.reason = store.with_read([&r] (const Bot_state& s) { return check_state(s, r.word); });
        }
        if (r.reason == Rejection::none) {
            // checked again under the write lock, another submitter may have won the race
            r.reason = store.with_write([&r, submitter] (Bot_state& s) -> Rejection {
                Rejection why = check_state(s, r.word);
                if (why == Rejection::none) {
                    State::Queued_suggestion q;
                    q.submitter = submitter;
                    q.word = r.word;
                    s.queue.push_back(q);
                }
                return why;
            });
        }

        Log::info() << "Suggestion " << r.word << " from " << submitter << ": " << r.reason;
        return r;
    }

    History_report query_history(const State::Store& store, const Timezone& tz,
                                 const ptime& utc_now, int days_back) {
        History_report report;
        report.days = std::max(1, std::min(days_back, max_days_back));
        const date cutoff = tz.local_date(utc_now) - boost::gregorian::days(report.days);

        report.rows = store.with_read([&cutoff] (const Bot_state& s) -> vector<Used_entry> {
            vector<Used_entry> rv;
            for (const Used_entry& e : s.history) {
                if (e.date >= cutoff) rv.push_back(e);
            }
            return rv;
        });
        std::stable_sort
            (report.rows.begin(),
             report.rows.end(),
             [] (const Used_entry& lhs, const Used_entry& rhs) {
                 if (lhs.date != rhs.date) return lhs.date > rhs.date;
                 return lhs.word < rhs.word;
             });
        return report;
    }

    string History_report::render(size_t budget) const {
        std::stringstream header;
        if (rows.empty()) {
            header << "No entries in the last " << days << " days.";
            return header.str();
        }
        header << "Previous starting words for the last " << days << " days\n";
        string out = header.str();
        for (const Used_entry& e : rows) {
            string line = boost::gregorian::to_iso_extended_string(e.date) + " — `" + e.word + "`\n";
            if (out.size() + line.size() > budget) break;
            out += line;
        }
        return out;
    }

    void test() {
        Log::Level saved_level = Log::get_level();
        Log::set_level(Log::Level::off);

        Lexicon lex = Lexicon::of_scores({{"abcde", 1.0}, {"crane", 2.0}, {"fjord", 3.0}, {"nymph", 4.0}});
        State::Store store("");
        store.with_write([] (Bot_state& s) { s.mark_used(date(2025, 1, 1), "fjord", boost::none); });

        std::stringstream output1;
        std::stringstream expected1;
        const char* raw[] = { "abcd", "ABCDE", "  Crane ", "fjord", "abcde", "zzzzz", "cr4ne", "crane" };
        for (const char* w : raw) {
            Suggestion_result r = submit_suggestion(store, lex, 7, w);
            output1 << r.reason << ":" << r.word << " ";
        }
        expected1 << "invalid_format:abcd accepted:abcde accepted:crane already_used:fjord "
                  << "already_queued:abcde not_in_lexicon:zzzzz invalid_format:cr4ne already_queued:crane ";

        std::string output1_str = output1.str();
        std::string expected1_str = expected1.str();
        if (output1_str != expected1_str) {
            Log::set_level(saved_level);
            throw std::runtime_error("Commands::test() 1 failed, got " + output1_str + ", but expected " + expected1_str);
        }

        std::stringstream output2;
        store.with_read([&output2] (const Bot_state& s) -> int {
            for (const State::Queued_suggestion& q : s.queue) output2 << q.submitter << ":" << q.word << " ";
            return 0;
        });
        Suggestion_result ok = submit_suggestion(store, lex, 8, "NYMPH");
        Suggestion_result bad = submit_suggestion(store, lex, 8, "x");
        output2 << ok.message() << " " << bad.message();
        std::string expected2 = "7:abcde 7:crane Queued `nymph`. Rejected: provide a 5-letter a–z word.";
        if (output2.str() != expected2) {
            Log::set_level(saved_level);
            throw std::runtime_error("Commands::test() 2 failed, got " + output2.str() + ", but expected " + expected2);
        }

        // a snapshot can carry queue entries that were never normalized
        State::Store loaded("");
        Bot_state snapshot = Bot_state::of_string("{\"used\": [], \"history\": [], \"queue\": [[\"1\", \"CRANE\"]]}");
        loaded.with_write([&snapshot] (Bot_state& s) { s = snapshot; });
        Suggestion_result dup = submit_suggestion(loaded, lex, 2, "crane");
        size_t queued = loaded.with_read([] (const Bot_state& s) { return s.queue.size(); });
        if (dup.reason != Rejection::already_queued || queued != 1) {
            Log::set_level(saved_level);
            std::stringstream got;
            got << dup.reason << " with " << queued << " queued";
            throw std::runtime_error("Commands::test() 6 failed, got " + got.str() + ", but expected already_queued with 1 queued");
        }

        // history: cutoff is inclusive, newest first, same date alphabetical
        State::Store hist("");
        hist.with_write([] (Bot_state& s) {
            s.mark_used(date(2025, 3, 1), "old__", boost::none);   // before the cutoff
            s.mark_used(date(2025, 3, 2), "edge_", boost::none);   // on the cutoff
            s.mark_used(date(2025, 3, 10), "zebra", boost::none);
            s.mark_used(date(2025, 3, 10), "apple", User_id(3));
            s.mark_used(date(2025, 3, 17), "tomor", boost::none);  // tomorrow's word is already in history
        });
        Timezone utc = Timezone::utc();
        ptime now = boost::posix_time::time_from_string("2025-03-16 10:00:00");
        History_report report = query_history(hist, utc, now, 14);
        std::string rendered = report.render();
        std::string expected3 =
            "Previous starting words for the last 14 days\n"
            "2025-03-17 — `tomor`\n"
            "2025-03-10 — `apple`\n"
            "2025-03-10 — `zebra`\n"
            "2025-03-02 — `edge_`\n";
        if (rendered != expected3) {
            Log::set_level(saved_level);
            throw std::runtime_error("Commands::test() 3 failed, got\n" + rendered + "but expected\n" + expected3);
        }

        // clamping, empty result, budget
        History_report none = query_history(hist, utc, boost::posix_time::time_from_string("2030-01-01 00:00:00"), 0);
        History_report all = query_history(hist, utc, now, 100000);
        std::string small = report.render(80);
        Log::set_level(saved_level);
        if (none.days != 1 || none.render() != "No entries in the last 1 days."
            || all.days != 3650 || all.rows.size() != 5) {
            throw std::runtime_error("Commands::test() 4 failed, got " + none.render() + " / " + all.render());
        }
        // header is 45 bytes, each row 23 (the dash is 3 bytes): only one row fits in 80
        if (small != "Previous starting words for the last 14 days\n2025-03-17 — `tomor`\n") {
            throw std::runtime_error("Commands::test() 5 failed, got " + small);
        }
    }
}

#include <sstream>
#include <memory>
#include <algorithm>
#include <boost/lexical_cast.hpp>
#include "state.hpp"
#include "errors.hpp"
#include "word.hpp"

using std::string;
using boost::gregorian::date;

namespace State {
    bool Used_entry::operator==(const Used_entry& r) const {
        return date == r.date && word == r.word && suggested_by == r.suggested_by;
    }

    bool Queued_suggestion::operator==(const Queued_suggestion& r) const {
        return submitter == r.submitter && word == r.word;
    }

    void Bot_state::mark_used(const date& d, const string& word, const boost::optional<User_id>& suggested_by) {
        used.insert(word);
        Used_entry e;
        e.date = d;
        e.word = word;
        e.suggested_by = suggested_by;
        history.push_back(e);
    }

    const Used_entry* Bot_state::find_entry(const date& d) const {
        for (auto it = history.rbegin(); it != history.rend(); ++it) {
            if (it->date == d) return &*it;
        }
        return nullptr;
    }

    bool Bot_state::is_used(const string& word) const {
        return used.count(word) > 0;
    }

    // queued words are only normalized when drained, so compare normalized forms
    bool Bot_state::is_queued(const string& word) const {
        const string key = Word::normalize(word);
        return std::any_of(queue.begin(), queue.end(), [&key] (const Queued_suggestion& q) { return Word::normalize(q.word) == key; });
    }

    bool Bot_state::operator==(const Bot_state& r) const {
        return used == r.used && history == r.history && queue == r.queue;
    }

    // internal to this file

    static Json::Value json_of_id(User_id id) {
        return Json::Value(boost::lexical_cast<string>(id));
    }

    static User_id id_of_json(const Json::Value& v) {
        if (v.isString()) {
            const string s = v.asString();
            if (s.empty() || s.size() > 20 || !std::all_of(s.begin(), s.end(), [] (char c) { return c >= '0' && c <= '9'; })) {
                throw State_load_error("Bad user id: " + s);
            }
            try {
                return boost::lexical_cast<User_id>(s);
            } catch (const boost::bad_lexical_cast&) {
                throw State_load_error("Bad user id: " + s);
            }
        }
        if (v.isUInt64()) return v.asUInt64();
        throw State_load_error("User id must be a string or an unsigned integer");
    }

    static const Json::Value& member(const Json::Value& obj, const char* key) {
        if (!obj.isObject() || !obj.isMember(key)) {
            throw State_load_error(string("Missing field: ") + key);
        }
        return obj[key];
    }

    static string string_of_json(const Json::Value& v, const char* what) {
        if (!v.isString()) throw State_load_error(string(what) + " must be a string");
        return v.asString();
    }

    static date date_of_json(const Json::Value& v) {
        string s = string_of_json(v, "date");
        date d;
        try {
            d = boost::gregorian::from_simple_string(s);
        } catch (const std::exception& e) {
            throw State_load_error("Bad date: " + s + " (" + e.what() + ")");
        }
        if (d.is_special()) throw State_load_error("Bad date: " + s);
        return d;
    }

    Json::Value Bot_state::to_json() const {
        Json::Value root(Json::objectValue);

        Json::Value u(Json::arrayValue);
        for (const string& w : used) u.append(w);
        root["used"] = u;

        Json::Value h(Json::arrayValue);
        for (const Used_entry& e : history) {
            Json::Value entry(Json::objectValue);
            entry["date"] = boost::gregorian::to_iso_extended_string(e.date);
            entry["word"] = e.word;
            entry["suggested_by"] = e.suggested_by ? json_of_id(*e.suggested_by) : Json::Value(Json::nullValue);
            h.append(entry);
        }
        root["history"] = h;

        Json::Value q(Json::arrayValue);
        for (const Queued_suggestion& s : queue) {
            Json::Value pair(Json::arrayValue);
            pair.append(json_of_id(s.submitter));
            pair.append(s.word);
            q.append(pair);
        }
        root["queue"] = q;
        return root;
    }

    Bot_state Bot_state::of_json(const Json::Value& root) {
        Bot_state s;

        const Json::Value& u = member(root, "used");
        if (!u.isArray()) throw State_load_error("used must be an array");
        for (const Json::Value& w : u) {
            s.used.insert(string_of_json(w, "used word"));
        }

        const Json::Value& h = member(root, "history");
        if (!h.isArray()) throw State_load_error("history must be an array");
        for (const Json::Value& entry : h) {
            Used_entry e;
            e.date = date_of_json(member(entry, "date"));
            e.word = string_of_json(member(entry, "word"), "word");
            if (entry.isMember("suggested_by") && !entry["suggested_by"].isNull()) {
                e.suggested_by = id_of_json(entry["suggested_by"]);
            }
            s.history.push_back(e);
        }

        const Json::Value& q = member(root, "queue");
        if (!q.isArray()) throw State_load_error("queue must be an array");
        for (const Json::Value& pair : q) {
            if (!pair.isArray() || pair.size() != 2) {
                throw State_load_error("queue entries must be [submitter, word]");
            }
            Queued_suggestion qs;
            qs.submitter = id_of_json(pair[0]);
            qs.word = string_of_json(pair[1], "queued word");
            s.queue.push_back(qs);
        }
        return s;
    }

    string Bot_state::to_string() const {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        return Json::writeString(builder, to_json());
    }

    Bot_state Bot_state::of_string(const string& r) {
        Json::CharReaderBuilder builder;
        builder["collectComments"] = false;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        Json::Value root;
        string errs;
        if (!reader->parse(r.data(), r.data() + r.size(), &root, &errs)) {
            throw State_load_error("Malformed state: " + errs);
        }
        return of_json(root);
    }

    void Bot_state::test() {
        Bot_state s;
        s.mark_used(date(2025, 1, 30), "crane", boost::none);
        s.mark_used(date(2025, 1, 31), "nymph", User_id(184467440737095516ULL));
        s.queue.push_back({42, "fjord"});
        s.queue.push_back({7, "qajaq"});

        std::stringstream output1;
        std::stringstream expected1;
        const Used_entry* e = s.find_entry(date(2025, 1, 31));
        output1 << s.used.size() << " "
                << (e ? e->word : string("-")) << " "
                << (s.find_entry(date(2025, 2, 1)) == nullptr) << " "
                << s.is_used("crane") << s.is_used("fjord") << " "
                << s.is_queued("fjord") << s.is_queued("crane");
        expected1 << "2 nymph 1 10 10";

        std::string output1_str = output1.str();
        std::string expected1_str = expected1.str();
        if (output1_str != expected1_str) {
            throw std::runtime_error("Bot_state::test() 1 failed, got " + output1_str + ", but expected " + expected1_str);
        }

        Bot_state back = of_string(s.to_string());
        if (!(back == s)) {
            throw std::runtime_error("Bot_state::test() 2 failed, round trip changed the state:\n" + s.to_string() + "\n" + back.to_string());
        }

        // ids as bare numbers, missing suggested_by, empty file shapes
        Bot_state parsed = of_string(
            "{ \"used\": [\"crane\", \"fjord\"],"
            "  \"history\": [ { \"date\": \"2024-12-31\", \"word\": \"crane\", \"suggested_by\": 99 },"
            "                 { \"date\": \"2025-01-01\", \"word\": \"fjord\" } ],"
            "  \"queue\": [ [\"5\", \"nymph\"], [6, \"apple\"] ] }");
        std::stringstream output3;
        std::stringstream expected3;
        for (const Used_entry& h : parsed.history) {
            output3 << h.date << " " << h.word << " " << (h.suggested_by ? *h.suggested_by : 0) << ",";
        }
        for (const Queued_suggestion& q : parsed.queue) {
            output3 << q.submitter << ":" << q.word << ",";
        }
        expected3 << "2024-Dec-31 crane 99,2025-Jan-01 fjord 0,5:nymph,6:apple,";

        std::string output3_str = output3.str();
        std::string expected3_str = expected3.str();
        if (output3_str != expected3_str) {
            throw std::runtime_error("Bot_state::test() 3 failed, got " + output3_str + ", but expected " + expected3_str);
        }

        const char* bad[] = {
            "",
            "[]",
            "{ \"used\": [], \"history\": [] }",
            "{ \"used\": [1], \"history\": [], \"queue\": [] }",
            "{ \"used\": [], \"history\": [ { \"date\": \"2025-02-30\", \"word\": \"crane\" } ], \"queue\": [] }",
            "{ \"used\": [], \"history\": [ { \"date\": \"yesterday\", \"word\": \"crane\" } ], \"queue\": [] }",
            "{ \"used\": [], \"history\": [], \"queue\": [ [\"-5\", \"nymph\"] ] }",
            "{ \"used\": [], \"history\": [], \"queue\": [ [\"5\"] ] }",
            "{ \"used\": [], \"history\": [], \"queue\": [ ] ",
        };
        for (const char* b : bad) {
            bool threw = false;
            try {
                of_string(b);
            } catch (const State_load_error&) {
                threw = true;
            }
            if (!threw) {
                throw std::runtime_error(string("Bot_state::test() 4 failed, accepted: ") + b);
            }
        }
    }
}

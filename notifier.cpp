#include <sstream>
#include <memory>
#include <curl/curl.h>
#include <json/json.h>
#include <boost/lexical_cast.hpp>
#include <boost/thread/lock_guard.hpp>
#include "notifier.hpp"
#include "errors.hpp"
#include "log.hpp"

using std::string;
using std::vector;
using boost::gregorian::date;
using State::User_id;

namespace Notify {
    string mention(User_id id) {
        return "<@" + boost::lexical_cast<string>(id) + ">";
    }

    string format_announcement(uint64_t role_id, const date& d, const string& word,
                               const boost::optional<User_id>& suggested_by) {
        std::stringstream ss;
        if (role_id) ss << "<@&" << role_id << ">\n";
        ss << "Tomorrow’s Wordle starter (" << boost::gregorian::to_iso_extended_string(d) << ") is: ||`" << word << "`||\n";
        if (suggested_by) ss << "Suggested by " << mention(*suggested_by);
        return ss.str();
    }

    //////////////////
    // Stream_notifier

    Stream_notifier::Stream_notifier(std::ostream& os_, uint64_t role_id_) : os(os_), role_id(role_id_) {}

    void Stream_notifier::announce(const date& d, const string& word, const boost::optional<User_id>& suggested_by) {
        boost::lock_guard<boost::mutex> lock(os_mutex);
        os << format_announcement(role_id, d, word, suggested_by) << std::endl;
        if (!os.good()) throw Notification_error("Can't write announcement to stream");
    }

    //////////////////
    // Http_notifier

    static size_t write_callback(char* contents, size_t size, size_t nmemb, void* userp) {
        size_t realsize = size * nmemb;
        static_cast<string*>(userp)->append(contents, realsize);
        return realsize;
    }

    Http_notifier::Http_notifier(const string& api_base_, const string& bot_token_,
                                 uint64_t channel_id_, uint64_t role_id_, long timeout_seconds_) :
        api_base(api_base_),
        bot_token(bot_token_),
        channel_id(channel_id_),
        role_id(role_id_),
        timeout_seconds(timeout_seconds_)
    {
        while (!api_base.empty() && api_base[api_base.size() - 1] == '/') api_base.erase(api_base.size() - 1);
    }

    string Http_notifier::url() const {
        return api_base + "/channels/" + boost::lexical_cast<string>(channel_id) + "/messages";
    }

    string Http_notifier::body(const string& message) const {
        Json::Value root(Json::objectValue);
        root["content"] = message;
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "";
        return Json::writeString(builder, root);
    }

    void Http_notifier::announce(const date& d, const string& word, const boost::optional<User_id>& suggested_by) {
        const string target = url();
        const string payload = body(format_announcement(role_id, d, word, suggested_by));
        const string auth = "Authorization: Bot " + bot_token;

        std::unique_ptr<CURL, void (*)(CURL*)> curl(curl_easy_init(), curl_easy_cleanup);
        if (!curl) throw Notification_error("curl_easy_init failed");

        struct curl_slist* raw_headers = nullptr;
        raw_headers = curl_slist_append(raw_headers, "Content-Type: application/json");
        raw_headers = curl_slist_append(raw_headers, auth.c_str());
        std::unique_ptr<struct curl_slist, void (*)(struct curl_slist*)> headers(raw_headers, curl_slist_free_all);

        string response;
        curl_easy_setopt(curl.get(), CURLOPT_URL, target.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, static_cast<void*>(&response));
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "wordstarter");

        CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            throw Notification_error(string("POST ") + target + " failed: " + curl_easy_strerror(res));
        }
        long code = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
        if (code < 200 || code >= 300) {
            throw Notification_error("POST " + target + " returned HTTP " + boost::lexical_cast<string>(code)
                                     + ": " + response.substr(0, 200));
        }
        Log::info() << "Announced " << word << " for " << boost::gregorian::to_iso_extended_string(d)
                    << " to channel " << channel_id;
    }

    //////////////////
    // Recording_notifier

    Recording_notifier::Recording_notifier() : failures_left(0) {}

    void Recording_notifier::announce(const date& d, const string& word, const boost::optional<User_id>& suggested_by) {
        boost::lock_guard<boost::mutex> lock(m);
        if (failures_left > 0) {
            failures_left--;
            throw Notification_error("Recording_notifier told to fail");
        }
        Announcement a;
        a.date = d;
        a.word = word;
        a.suggested_by = suggested_by;
        announcements.push_back(a);
    }

    void Recording_notifier::fail_next(int n) {
        boost::lock_guard<boost::mutex> lock(m);
        failures_left = n;
    }

    vector<Recording_notifier::Announcement> Recording_notifier::get_announcements() const {
        boost::lock_guard<boost::mutex> lock(m);
        return announcements;
    }

    size_t Recording_notifier::count() const {
        boost::lock_guard<boost::mutex> lock(m);
        return announcements.size();
    }

    void test() {
        std::stringstream output1;
        std::stringstream expected1;
        Stream_notifier sn(output1, 555);
        sn.announce(date(2025, 2, 1), "crane", boost::none);
        sn.announce(date(2025, 2, 2), "nymph", User_id(42));
        Stream_notifier quiet(output1, 0);
        quiet.announce(date(2025, 2, 3), "fjord", boost::none);

        expected1 << "<@&555>\nTomorrow’s Wordle starter (2025-02-01) is: ||`crane`||\n" << std::endl
                  << "<@&555>\nTomorrow’s Wordle starter (2025-02-02) is: ||`nymph`||\nSuggested by <@42>" << std::endl
                  << "Tomorrow’s Wordle starter (2025-02-03) is: ||`fjord`||\n" << std::endl;

        std::string output1_str = output1.str();
        std::string expected1_str = expected1.str();
        if (output1_str != expected1_str) {
            throw std::runtime_error("Notify::test() 1 failed, got " + output1_str + ", but expected " + expected1_str);
        }

        Http_notifier hn("https://chat.example/api/v10/", "token", 123456789012345678ULL, 0);
        Json::Value parsed;
        {
            Json::CharReaderBuilder builder;
            std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
            string b = hn.body("say \"hi\"\n");
            string errs;
            if (!reader->parse(b.data(), b.data() + b.size(), &parsed, &errs)) {
                throw std::runtime_error("Notify::test() 2 failed, body is not JSON: " + b);
            }
        }
        if (hn.url() != "https://chat.example/api/v10/channels/123456789012345678/messages"
            || parsed["content"].asString() != "say \"hi\"\n") {
            throw std::runtime_error("Notify::test() 2 failed, got " + hn.url());
        }

        // nothing listens on port 1
        Http_notifier unreachable("http://127.0.0.1:1", "token", 1, 0, 5);
        bool threw = false;
        try {
            unreachable.announce(date(2025, 2, 1), "crane", boost::none);
        } catch (const Notification_error&) {
            threw = true;
        }
        if (!threw) throw std::runtime_error("Notify::test() 3 failed, unreachable endpoint did not throw");

        Recording_notifier rn;
        rn.fail_next(1);
        threw = false;
        try {
            rn.announce(date(2025, 2, 1), "crane", boost::none);
        } catch (const Notification_error&) {
            threw = true;
        }
        rn.announce(date(2025, 2, 1), "crane", User_id(9));
        if (!threw || rn.count() != 1 || rn.get_announcements()[0].suggested_by != User_id(9)) {
            throw std::runtime_error("Notify::test() 4 failed, recording notifier misbehaved");
        }
    }
}

/* Where the daily word gets announced. The scheduler only knows Notifier_intf;
   main picks a chat channel (Http_notifier) or stdout (Stream_notifier).
   Announcing the same date twice is allowed, the cycle re-announces after a
   failed delivery.
*/

#pragma once
#include <string>
#include <vector>
#include <iostream>
#include <cstdint>
#include <boost/optional.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "state.hpp"

namespace Notify {
    // role_id 0 means no role mention
    std::string format_announcement(uint64_t role_id,
                                    const boost::gregorian::date& date,
                                    const std::string& word,
                                    const boost::optional<State::User_id>& suggested_by);

    std::string mention(State::User_id id);

    class Notifier_intf {
    public:
        virtual ~Notifier_intf() {};
        // throws Notification_error
        virtual void announce(const boost::gregorian::date& date,
                              const std::string& word,
                              const boost::optional<State::User_id>& suggested_by) = 0;
    };

    class Stream_notifier : public Notifier_intf {
    public:
        Stream_notifier(std::ostream& os, uint64_t role_id);
        virtual void announce(const boost::gregorian::date& date,
                              const std::string& word,
                              const boost::optional<State::User_id>& suggested_by);
    private:
        std::ostream& os;
        uint64_t role_id;
        boost::mutex os_mutex;
    };

    // Posts {"content": message} to <api_base>/channels/<channel_id>/messages with
    // a bot token, one blocking request per announcement.
    class Http_notifier : public Notifier_intf {
    public:
        Http_notifier(const std::string& api_base, const std::string& bot_token,
                      uint64_t channel_id, uint64_t role_id, long timeout_seconds = 30);
        virtual void announce(const boost::gregorian::date& date,
                              const std::string& word,
                              const boost::optional<State::User_id>& suggested_by);

        std::string url() const;
        std::string body(const std::string& message) const;
    private:
        std::string api_base;
        std::string bot_token;
        uint64_t channel_id;
        uint64_t role_id;
        long timeout_seconds;
    };

    // Keeps every announcement, optionally failing the next [n] deliveries.
    class Recording_notifier : public Notifier_intf {
    public:
        struct Announcement {
            boost::gregorian::date date;
            std::string word;
            boost::optional<State::User_id> suggested_by;
        };

        Recording_notifier();
        virtual void announce(const boost::gregorian::date& date,
                              const std::string& word,
                              const boost::optional<State::User_id>& suggested_by);

        void fail_next(int n);
        std::vector<Announcement> get_announcements() const;
        size_t count() const;
    private:
        mutable boost::mutex m;
        std::vector<Announcement> announcements;
        int failures_left;
    };

    void test();
}

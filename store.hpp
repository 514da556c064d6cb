/* The one shared Bot_state of the process, behind a reader/writer lock.

   Nobody touches the lock directly. Readers go through with_read, writers through
   with_write, which also writes the whole state to disk before it returns:

       bool used = store.with_read([&] (const Bot_state& s) { return s.is_used(w); });
       store.with_write([&] (Bot_state& s) { s.queue.push_back({uid, w}); });

   The snapshot is written to <path>.tmp, fsync'd and renamed over <path>, so the
   file on disk is always either the old state or the new one.
*/

#pragma once
#include <string>
#include <atomic>
#include <utility>
#include <boost/thread/shared_mutex.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/locks.hpp>
#include "state.hpp"

namespace State {
    class Store {
    public:
        // an empty path keeps everything in memory, nothing is read or written
        Store(const std::string& path);

        // a missing file leaves the state empty, a malformed one throws State_load_error
        void load();

        // throws State_persist_error
        void save() const;

        template <typename F>
        auto with_read(F f) const -> decltype(f(std::declval<const Bot_state&>())) {
            boost::shared_lock<boost::shared_mutex> lock(mutex);
            const Bot_state& s = state;
            return f(s);
        }

        // If the save fails the error is logged and counted, and the mutation stays.
        template <typename F>
        auto with_write(F f) -> decltype(f(std::declval<Bot_state&>())) {
            boost::unique_lock<boost::shared_mutex> lock(mutex);
            Persist_on_exit persist(*this);
            return f(state);
        }

        const std::string& get_path() const { return path; }
        size_t failed_saves() const { return save_failures; }

        static void test();
    private:
        // runs after the with_write closure, while the write lock is still held
        class Persist_on_exit {
        public:
            Persist_on_exit(Store& s) : store(s) {}
            ~Persist_on_exit() { store.persist_locked(); }
        private:
            Store& store;
        };

        void persist_locked();
        void write_snapshot(const std::string& contents) const;

        std::string path;
        Bot_state state;
        mutable boost::shared_mutex mutex;
        mutable boost::mutex file_mutex; // one writer of <path>.tmp at a time
        std::atomic<size_t> save_failures;
    };
}

#include <fstream>
#include <sstream>
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <fcntl.h>
#include <unistd.h>
#include <boost/filesystem.hpp>
#include <boost/thread/thread.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "store.hpp"
#include "errors.hpp"
#include "log.hpp"

using std::string;
using boost::posix_time::ptime;
using boost::posix_time::microsec_clock;
namespace fs = boost::filesystem;

namespace State {
    static string errno_string(const string& what, const string& file) {
        return what + " " + file + ": " + std::strerror(errno);
    }

    Store::Store(const string& path_) : path(path_), save_failures(0) {}

    void Store::load() {
        if (path.empty()) return;

        fs::path p(path);
        if (p.has_parent_path()) {
            boost::system::error_code ec;
            fs::create_directories(p.parent_path(), ec);
            if (ec) Log::warn() << "Can't create state directory " << p.parent_path().string() << ": " << ec.message();
        }

        boost::system::error_code ec;
        bool present = fs::exists(p, ec);
        if (ec) {
            throw State_load_error("Can't stat " + path + ": " + ec.message());
        }
        if (!present) {
            Log::info() << "No state at " << path << ", starting empty";
            return;
        }

        ptime start = microsec_clock::universal_time();
        std::ifstream ifs(path.c_str(), std::ios::binary);
        if (!ifs.is_open()) {
            throw State_load_error(errno_string("Can't open", path));
        }
        std::stringstream contents;
        contents << ifs.rdbuf();
        if (ifs.bad()) {
            throw State_load_error("Error reading " + path);
        }

        Bot_state loaded = Bot_state::of_string(contents.str());
        size_t orphans = 0;
        for (const Used_entry& e : loaded.history) {
            if (!loaded.is_used(e.word)) orphans++;
        }
        if (orphans) {
            Log::warn() << path << ": " << orphans << " history words are missing from the used set";
        }

        boost::unique_lock<boost::shared_mutex> lock(mutex);
        state = loaded;
        Log::info() << "Read state from " << path << ": "
                    << state.used.size() << " used, "
                    << state.history.size() << " history, "
                    << state.queue.size() << " queued, took "
                    << (microsec_clock::universal_time() - start).total_microseconds() / 1e6 << "s";
    }

    void Store::save() const {
        if (path.empty()) return;
        string contents = with_read([] (const Bot_state& s) { return s.to_string(); });
        write_snapshot(contents);
    }

    void Store::persist_locked() {
        if (path.empty()) return;
        try {
            write_snapshot(state.to_string());
        } catch (const std::exception& e) {
            save_failures++;
            Log::error() << "State not saved, keeping it in memory: " << e.what();
        }
    }

    void Store::write_snapshot(const string& contents) const {
        boost::lock_guard<boost::mutex> lock(file_mutex);
        const string tmp = path + ".tmp";

        int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (fd < 0) {
            throw State_persist_error(errno_string("Can't create", tmp));
        }

        const char* p = contents.data();
        size_t left = contents.size();
        while (left > 0) {
            ssize_t n = ::write(fd, p, left);
            if (n < 0) {
                if (errno == EINTR) continue;
                string msg = errno_string("Can't write", tmp);
                ::close(fd);
                ::unlink(tmp.c_str());
                throw State_persist_error(msg);
            }
            p += n;
            left -= static_cast<size_t>(n);
        }
        if (::fsync(fd) != 0) {
            string msg = errno_string("Can't sync", tmp);
            ::close(fd);
            ::unlink(tmp.c_str());
            throw State_persist_error(msg);
        }
        if (::close(fd) != 0) {
            string msg = errno_string("Can't close", tmp);
            ::unlink(tmp.c_str());
            throw State_persist_error(msg);
        }
        if (::rename(tmp.c_str(), path.c_str()) != 0) {
            string msg = errno_string("Can't rename " + tmp + " to", path);
            ::unlink(tmp.c_str());
            throw State_persist_error(msg);
        }

        // make the rename itself durable
        fs::path parent = fs::path(path).parent_path();
        string dir = parent.empty() ? string(".") : parent.string();
        int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
        if (dfd < 0) {
            throw State_persist_error(errno_string("Can't open directory", dir));
        }
        int rc = ::fsync(dfd);
        string msg = rc != 0 ? errno_string("Can't sync directory", dir) : string();
        ::close(dfd);
        if (rc != 0) throw State_persist_error(msg);
    }

    void Store::test() {
        Log::Level saved_level = Log::get_level();
        Log::set_level(Log::Level::off);

        char tmpl[] = "/tmp/wordstarter-store.XXXXXX";
        if (!::mkdtemp(tmpl)) throw std::runtime_error("Store::test() can't make a temp directory");
        const fs::path dir(tmpl);
        struct Cleanup {
            fs::path dir;
            Log::Level level;
            ~Cleanup() {
                boost::system::error_code ec;
                fs::remove_all(dir, ec);
                Log::set_level(level);
            }
        } cleanup = { dir, saved_level };

        // memory only
        Store mem("");
        mem.load();
        mem.with_write([] (Bot_state& s) { s.queue.push_back({1, "crane"}); });
        size_t queued = mem.with_read([] (const Bot_state& s) { return s.queue.size(); });
        if (queued != 1 || mem.failed_saves() != 0) {
            throw std::runtime_error("Store::test() 1 failed, memory store lost a write");
        }

        // missing file: empty state, parent directory created
        const string path = (dir / "nested" / "state.json").string();
        Store store(path);
        store.load();
        if (!fs::is_directory(dir / "nested") || store.with_read([] (const Bot_state& s) { return !(s == Bot_state()); })) {
            throw std::runtime_error("Store::test() 2 failed, fresh store is not empty");
        }

        // every write lands on disk before with_write returns, no temp file left
        std::string word = store.with_write([] (Bot_state& s) -> string {
            s.mark_used(boost::gregorian::date(2025, 3, 1), "fjord", User_id(77));
            s.queue.push_back({5, "nymph"});
            return string("fjord");
        });
        if (word != "fjord" || !fs::exists(path) || fs::exists(path + ".tmp")) {
            throw std::runtime_error("Store::test() 3 failed, snapshot not written atomically");
        }
        Store reread(path);
        reread.load();
        Bot_state a = store.with_read([] (const Bot_state& s) { return s; });
        Bot_state b = reread.with_read([] (const Bot_state& s) { return s; });
        if (!(a == b)) {
            throw std::runtime_error("Store::test() 4 failed, reloaded state differs:\n" + a.to_string() + "\n" + b.to_string());
        }

        // malformed snapshot is fatal
        {
            std::ofstream junk((dir / "junk.json").string().c_str());
            junk << "{ \"used\": [ ";
        }
        Store broken((dir / "junk.json").string());
        bool threw = false;
        try {
            broken.load();
        } catch (const State_load_error&) {
            threw = true;
        }
        if (!threw) throw std::runtime_error("Store::test() 5 failed, malformed snapshot loaded");

        // a failing disk write is swallowed by with_write, the change stays in memory
        {
            std::ofstream blocker((dir / "blocker").string().c_str());
            blocker << "not a directory";
        }
        Store unwritable((dir / "blocker" / "state.json").string());
        unwritable.with_write([] (Bot_state& s) { s.used.insert("crane"); });
        bool still_there = unwritable.with_read([] (const Bot_state& s) { return s.is_used("crane"); });
        if (!still_there || unwritable.failed_saves() != 1) {
            throw std::runtime_error("Store::test() 6 failed, persist failure not handled");
        }
        threw = false;
        try {
            unwritable.save();
        } catch (const State_persist_error&) {
            threw = true;
        }
        if (!threw) throw std::runtime_error("Store::test() 7 failed, save() should throw");

        // a snapshot that can't be stat'ed is an error, not a fresh start
        Store unstattable((dir / (string(300, 's') + ".json")).string());
        threw = false;
        try {
            unstattable.load();
        } catch (const State_load_error&) {
            threw = true;
        }
        if (!threw) throw std::runtime_error("Store::test() 8 failed, stat error treated as a missing file");

        // concurrent writers are linearized
        const int threads = 8;
        const int per_thread = 25;
        boost::thread_group group;
        for (int t = 0; t < threads; t++) {
            group.create_thread([&store, t] () {
                for (int i = 0; i < per_thread; i++) {
                    store.with_write([t, i] (Bot_state& s) { s.queue.push_back({User_id(t), "w" + std::to_string(t * 1000 + i)}); });
                    store.with_read([] (const Bot_state& s) { return s.queue.size(); });
                }
            });
        }
        group.join_all();
        Store after(path);
        after.load();
        size_t on_disk = after.with_read([] (const Bot_state& s) { return s.queue.size(); });
        if (on_disk != 1 + threads * per_thread) {
            throw std::runtime_error("Store::test() 9 failed, expected " + std::to_string(1 + threads * per_thread)
                                     + " queued on disk, got " + std::to_string(on_disk));
        }
    }
}

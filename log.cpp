#include <iostream>
#include <atomic>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/thread.hpp>
#include <boost/thread/lock_guard.hpp>
#include "log.hpp"

using std::string;
using std::cerr;
using std::endl;
using boost::posix_time::microsec_clock;

namespace Log {
    static std::atomic<Level> threshold(Level::info);
    static boost::mutex output_mutex;

    void set_level(Level l) { threshold = l; }
    Level get_level() { return threshold; }

    Level level_of_string(const string& str) {
        if (str == "info") return Level::info;
        if (str == "warn") return Level::warn;
        if (str == "error") return Level::error;
        if (str == "off") return Level::off;
        throw std::runtime_error("level_of_string: " + str);
    }

    std::ostream& operator<<(std::ostream& os, Level l) {
        switch (l) {
        case Level::info:  return os << "INFO";
        case Level::warn:  return os << "WARN";
        case Level::error: return os << "ERROR";
        case Level::off:   return os << "OFF";
        }
        return os;
    }

    Line::Line(Level level_) : level(level_), active(false) {
        Level t = threshold.load();
        active = level_ >= t && t != Level::off;
    }

    Line::Line(Line&& other) : level(other.level), active(other.active), ss(std::move(other.ss)) {
        other.active = false;
    }

    Line::~Line() {
        if (!active) return;
        string stamp = boost::posix_time::to_iso_extended_string(microsec_clock::universal_time());
        boost::lock_guard<boost::mutex> lock(output_mutex);
        cerr << stamp << "Z " << level << " " << ss.str() << endl;
    }

    Line info() { return Line(Level::info); }
    Line warn() { return Line(Level::warn); }
    Line error() { return Line(Level::error); }

    void test() {
        std::stringstream output;
        std::stringstream expected;
        output << level_of_string("info") << " "
               << level_of_string("warn") << " "
               << level_of_string("error") << " "
               << level_of_string("off");
        expected << "INFO WARN ERROR OFF";

        std::string output_str = output.str();
        std::string expected_str = expected.str();
        if (output_str != expected_str) {
            throw std::runtime_error("Log::test() 1 failed, got " + output_str + ", but expected " + expected_str);
        }

        bool threw = false;
        try {
            level_of_string("loud");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        if (!threw) throw std::runtime_error("Log::test() 2 failed, unknown level was accepted");

        Level saved = get_level();
        set_level(Level::error);
        Line quiet = info();
        Line loud = error();
        bool quiet_active = quiet.active;
        bool loud_active = loud.active;
        quiet.active = false;
        loud.active = false;
        set_level(Level::off);
        Line off = error();
        bool off_active = off.active;
        off.active = false;
        set_level(saved);
        if (quiet_active || !loud_active) throw std::runtime_error("Log::test() 3 failed, threshold not applied");
        if (off_active) throw std::runtime_error("Log::test() 4 failed, off still logs");

        // the level may change while other threads are logging
        set_level(Level::error);
        bool leaked = false;
        boost::thread reader([&leaked] () {
            for (int i = 0; i < 10000; i++) {
                Line l = info();
                if (l.active) {
                    leaked = true;
                    l.active = false;
                }
            }
        });
        for (int i = 0; i < 10000; i++) set_level(i % 2 ? Level::error : Level::off);
        reader.join();
        set_level(saved);
        if (leaked) throw std::runtime_error("Log::test() 5 failed, info logged while the level was error or off");
    }
}

/* Every failure the daemon can raise. Startup errors (config, lexicon, state load)
   abort the process; the rest are caught where they happen and logged.
   Suggestion rejections are not errors, see commands.hpp.
*/

#pragma once
#include <stdexcept>
#include <string>

class Config_error : public std::runtime_error {
public:
    explicit Config_error(const std::string& what) : std::runtime_error(what) {}
};

class Lexicon_load_error : public std::runtime_error {
public:
    explicit Lexicon_load_error(const std::string& what) : std::runtime_error(what) {}
};

class State_load_error : public std::runtime_error {
public:
    explicit State_load_error(const std::string& what) : std::runtime_error(what) {}
};

// swallowed (and logged) by Store::with_write, the in-memory state stands
class State_persist_error : public std::runtime_error {
public:
    explicit State_persist_error(const std::string& what) : std::runtime_error(what) {}
};

// the lexicon has no unused word left; fails the current cycle only
class No_candidate_error : public std::runtime_error {
public:
    explicit No_candidate_error(const std::string& what) : std::runtime_error(what) {}
};

class Notification_error : public std::runtime_error {
public:
    explicit Notification_error(const std::string& what) : std::runtime_error(what) {}
};

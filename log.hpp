/* Timestamped diagnostics on stderr.

       Log::info() << "Loaded " << n << " words";

   Each call returns a Line that collects the message and writes it as a single
   line when it goes out of scope, so lines from different threads never interleave.
*/

#pragma once
#include <sstream>
#include <string>

namespace Log {
    enum class Level : int
        { info = 0,
          warn = 1,
          error = 2,
          off = 3 };

    void set_level(Level l);
    Level get_level();
    Level level_of_string(const std::string& str);

    class Line {
    public:
        Line(Level level_);
        Line(Line&& other);
        ~Line();
        Line(const Line&) = delete;
        Line& operator=(const Line&) = delete;

        template <typename T>
        Line& operator<<(const T& x) {
            if (active) ss << x;
            return *this;
        }
    private:
        Level level;
        bool active;
        std::ostringstream ss;

        friend void test();
    };

    Line info();
    Line warn();
    Line error();

    std::ostream& operator<<(std::ostream& os, Level l);

    void test();
}

/* A five-letter word: exactly five ASCII letters, stored lowercase.

   Anything that reaches the lexicon, the suggestion queue or the history goes
   through here first, so the rest of the code can assume normalized words.
*/

#pragma once
#include <string>
#include <iostream>
#include <boost/optional.hpp>

class Word {
public:
    static const int length = 5;

    // trims and lowercases, throws if the result isn't five letters a-z
    Word(const std::string& r);

    // boost::none instead of throwing
    static boost::optional<Word> of_string(const std::string& r);

    // strips surrounding whitespace and lowercases ASCII letters
    static std::string normalize(const std::string& r);

    // true if [w] is already exactly five lowercase letters
    static bool is_valid(const std::string& w);

    bool operator==(const Word& r) const;
    bool operator<(const Word& r) const;
    char operator[](int pos) const { return letters[pos]; }

    bool contains(char c) const;
    int count(char c) const;
    std::string to_string() const;

    friend std::ostream& operator<<(std::ostream& os, const Word& x);

    static void test();
private:
    Word() {}
    char letters[length];
};

std::ostream& operator<<(std::ostream& os, const Word& x);

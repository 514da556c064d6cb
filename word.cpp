#include <sstream>
#include <cctype>
#include <algorithm>
#include "word.hpp"

using std::string;

string Word::normalize(const string& r) {
    size_t start = 0;
    size_t end = r.size();
    while (start < end && std::isspace(static_cast<unsigned char>(r[start]))) start++;
    while (end > start && std::isspace(static_cast<unsigned char>(r[end - 1]))) end--;

    string rv = r.substr(start, end - start);
    for (char& c : rv) {
        if (c >= 'A' && c <= 'Z') c = c - 'A' + 'a';
    }
    return rv;
}

bool Word::is_valid(const string& w) {
    if (w.length() != static_cast<size_t>(length)) return false;
    for (char c : w) {
        if (c < 'a' || c > 'z') return false;
    }
    return true;
}

boost::optional<Word> Word::of_string(const string& r) {
    string n = normalize(r);
    if (!is_valid(n)) return boost::none;
    Word w;
    std::copy(n.begin(), n.end(), w.letters);
    return w;
}

Word::Word(const string& r) {
    string n = normalize(r);
    if (!is_valid(n)) {
        throw std::runtime_error("Expected 5 letter word, not: " + r);
    }
    std::copy(n.begin(), n.end(), letters);
}

bool Word::operator==(const Word& r) const {
    return std::equal(letters, letters + length, r.letters);
}

bool Word::operator<(const Word& r) const {
    return std::lexicographical_compare(letters, letters + length, r.letters, r.letters + length);
}

bool Word::contains(char c) const {
    return count(c) > 0;
}

int Word::count(char c) const {
    return static_cast<int>(std::count(letters, letters + length, c));
}

string Word::to_string() const {
    return string(letters, length);
}

std::ostream& operator<<(std::ostream& os, const Word& x) {
    return os.write(x.letters, Word::length);
}

void Word::test() {
    std::stringstream output1;
    std::stringstream expected1;

    Word x("  CrAnE\n");
    Word y("zzxqj");
    output1 << x << " " << y << " "
            << x.contains('a') << x.contains('q') << " "
            << y.count('z') << " "
            << (x < y) << (y < x) << (x == Word("crane"))
            << std::endl;
    expected1 << "crane zzxqj 10 2 101" << std::endl;

    std::string output1_str = output1.str();
    std::string expected1_str = expected1.str();
    if (output1_str != expected1_str) {
        throw std::runtime_error("Word::test() 1 failed, got " + output1_str + ", but expected " + expected1_str);
    }

    std::stringstream output2;
    std::stringstream expected2;
    const char* raw[] = { "abcd", "abcdef", "ab de", "caf\xc3\xa9", "a1cde", "", "ABCDE", " hello " };
    for (const char* r : raw) {
        boost::optional<Word> w = of_string(r);
        output2 << (w ? w->to_string() : string("-")) << ",";
    }
    expected2 << "-,-,-,-,-,-,abcde,hello,";

    std::string output2_str = output2.str();
    std::string expected2_str = expected2.str();
    if (output2_str != expected2_str) {
        throw std::runtime_error("Word::test() 2 failed, got " + output2_str + ", but expected " + expected2_str);
    }

    bool threw = false;
    try {
        Word bad("four");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    if (!threw) {
        throw std::runtime_error("Word::test() 3 failed, short word was accepted");
    }

    if (is_valid("Crane") || !is_valid("crane")) {
        throw std::runtime_error("Word::test() 4 failed, is_valid must not normalize");
    }
}

#include <sstream>
#include <algorithm>
#include <stdexcept>
#include "guess.hpp"
#include "feedback.hpp"

const char Guess::correct_char = '.';
const char Guess::present_char = '~';
const char Guess::absent_char  = '_';
const char Guess::unset_char   = '?';

Guess::Guess() : equation() {
    tiles.fill(Tile::unset);
}

Guess::Guess(const std::string& r) {
    const size_t expected = 2 * Equation::length + 1;
    if (r.length() != expected || r[Equation::length] != ' ') {
        throw std::runtime_error("Expected equation and 8 results, not: '" + r + "'");
    }
    equation = Equation(r.substr(0, Equation::length));
    for (int i = 0; i < Equation::length; i++) {
        tiles[i] = tile_of_code(r[Equation::length + 1 + i]);
    }

    int unset = count(Tile::unset);
    if (unset != 0 && unset != Equation::length) {
        throw std::runtime_error("Partially scored guess: '" + r + "'");
    }
    if (unset == 0 && !equation.is_complete()) {
        throw std::runtime_error("Scored guess with blanks: '" + r + "'");
    }
}

Guess::Guess(const Equation& answer, const Equation& guess) : equation(guess) {
    if (!guess.is_complete()) {
        throw std::runtime_error("Can't score incomplete guess: '" + guess.to_string() + "'");
    }
    tiles.fill(Tile::unset);
    finalize(Feedback::score(answer, guess));
}

Tile Guess::get_result(int i) const { return tiles[i]; }
char Guess::get_char(int i) const { return equation[i]; }
const Equation& Guess::get_equation() const { return equation; }
const Guess::Tiles& Guess::get_tiles() const { return tiles; }

int Guess::count(Tile t) const {
    return std::count(tiles.begin(), tiles.end(), t);
}

bool Guess::is_finalized() const { return count(Tile::unset) == 0; }
bool Guess::is_all_correct() const { return count(Tile::correct) == Equation::length; }
int Guess::num_correct() const { return count(Tile::correct); }
int Guess::num_present() const { return count(Tile::present); }
int Guess::num_absent() const { return count(Tile::absent); }

void Guess::set_char(int pos, char c) {
    if (is_finalized()) {
        throw std::runtime_error("Can't edit a finalized guess: " + to_string());
    }
    equation.set(pos, c);
}

void Guess::finalize(const Tiles& t) {
    if (is_finalized()) {
        throw std::runtime_error("Guess finalized twice: " + to_string());
    }
    if (!equation.is_complete()) {
        throw std::runtime_error("Can't finalize incomplete guess: " + to_string());
    }
    if (std::find(t.begin(), t.end(), Tile::unset) != t.end()) {
        throw std::runtime_error("Can't finalize guess with unset tiles: " + equation.to_string());
    }
    tiles = t;
}

std::string Guess::to_string() const {
    std::string s = equation.to_string();
    s += ' ';
    for (Tile t : tiles) {
        s += code_of_tile(t);
    }
    return s;
}

bool Guess::operator==(const Guess& r) const {
    return equation == r.equation && tiles == r.tiles;
}

char Guess::code_of_tile(Tile t) {
    switch (t) {
    case Tile::correct: return correct_char;
    case Tile::present: return present_char;
    case Tile::absent:  return absent_char;
    case Tile::unset:   return unset_char;
    }
    return unset_char;
}

Tile Guess::tile_of_code(char c) {
    if (c == correct_char) return Tile::correct;
    if (c == present_char) return Tile::present;
    if (c == absent_char)  return Tile::absent;
    if (c == unset_char)   return Tile::unset;
    throw std::runtime_error(std::string("Unknown tile code: ") + c);
}

std::ostream& operator<<(std::ostream& os, Tile t) {
    return os << Guess::code_of_tile(t);
}

const char* const ansi_reset = "\033[0m";

const char* ansi_colour(Tile t) {
    switch (t) {
    case Tile::absent:  return "\033[37;40m";
    case Tile::present: return "\033[30;43m";
    case Tile::correct: return "\033[30;42m";
    case Tile::unset:   return ansi_reset;
    }
    return ansi_reset;
}

std::ostream& operator<<(std::ostream& os, const Guess& x) {
    for (int i = 0; i < Equation::length; i++) {
        os << ansi_colour(x.get_result(i)) << x.get_char(i);
    }
    return (os << ansi_reset);
}

void Guess::test() {
    std::stringstream output1;
    std::stringstream expected1;

    Guess blank;
    Guess typed("12+5     ????????");
    Guess scored("12+57=69 ..~_....");
    output1 << "[" << blank.to_string() << "] " << blank.is_finalized() << " "
            << typed.get_equation() << " " << typed.is_finalized() << " "
            << scored.num_correct() << scored.num_present() << scored.num_absent() << " "
            << scored.is_finalized() << scored.is_all_correct() << " "
            << scored.get_result(2) << scored.get_result(3) << " "
            << (Guess(scored.to_string()) == scored)
            << std::endl;

    expected1 << "[         ????????] 0 12+5     0 611 10 ~_ 1" << std::endl;

    std::string output1_str = output1.str();
    std::string expected1_str = expected1.str();
    if (output1_str != expected1_str) {
        throw std::runtime_error("Guess::test() 1 failed, got " + output1_str + ", but expected " + expected1_str);
    }

    std::stringstream output2;
    std::stringstream expected2;
    output2 << Guess(Equation("12+57=69"), Equation("12+57=69")).to_string() << std::endl;
    output2 << Guess(Equation("10+10=20"), Equation("01+01=20")).to_string() << std::endl;
    output2 << Guess(Equation("10+2-3=9"), Equation("99-90=09")).to_string() << std::endl;
    output2 << Guess(Equation("18/2*1=9"), Equation("2*9/1=18")).to_string() << std::endl;
    output2 << Guess(Equation("50-10=40"), Equation("11+11=22")).to_string() << std::endl;

    expected2 << "12+57=69 ........" << std::endl;
    expected2 << "01+01=20 ~~.~~..." << std::endl;
    expected2 << "99-90=09 __~_~~_." << std::endl;
    expected2 << "2*9/1=18 ~~~~~~~~" << std::endl;
    expected2 << "11+11=22 ___._.__" << std::endl;

    std::string output2_str = output2.str();
    std::string expected2_str = expected2.str();
    if (output2_str != expected2_str) {
        throw std::runtime_error("Guess::test() 2 failed, got\n" + output2_str + ", but expected\n" + expected2_str);
    }

    int rejected = 0;
    const char* bad[] = { "12+57=69 ..~_...",
                          "12+57=69-..~_....",
                          "12+57=69 ..~_..?.",
                          "12+57=6  ........",
                          "12+57=69 ..~_..x." };
    for (const char* s : bad) {
        try {
            Guess g(s);
        } catch (const std::runtime_error&) {
            rejected++;
        }
    }
    try {
        scored.finalize(scored.get_tiles());
    } catch (const std::runtime_error&) {
        rejected++;
    }
    try {
        scored.set_char(0, '3');
    } catch (const std::runtime_error&) {
        rejected++;
    }
    try {
        Guess g(Equation("12+57=69"), Equation("12+57=6 "));
    } catch (const std::runtime_error&) {
        rejected++;
    }
    if (rejected != 8) {
        throw std::runtime_error("Guess::test() 3 failed, only rejected " + std::to_string(rejected) + " of 8 bad inputs");
    }
}

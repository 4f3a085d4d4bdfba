/* Represents one row of the board: the equation the player typed plus the
   feedback for each of its eight tiles.

   A Guess starts blank with every tile unset, is typed into one character at a
   time, and is finalized exactly once when the row is submitted and scored.
   The text form (see the string constructor) is what gets persisted to resume a
   session, it's also handy for writing tests.
*/

#pragma once
#include <array>
#include "equation.hpp"

// Ordered by priority, the keyboard keeps the highest one it has seen.
enum class Tile : char
    { unset = 0,
      absent = 1,
      present = 2,
      correct = 3 };

class Guess {
public:
    typedef std::array<Tile, Equation::length> Tiles;

    // blank row, all tiles unset
    Guess();

    // format is "12+57=69 ..~_...."
    // means the + is present elsewhere and the 5 is absent. An unset tile is '?',
    // either all tiles are unset or none are.
    Guess(const std::string& r);

    // a finalized guess, [guess] must be complete
    Guess(const Equation& answer, const Equation& guess);

    Tile get_result(int i) const;
    char get_char(int i) const;
    const Equation& get_equation() const;
    const Tiles& get_tiles() const;

    bool is_finalized() const;
    bool is_all_correct() const;
    int num_correct() const;
    int num_present() const;
    int num_absent() const;

    // typing, throws once finalized
    void set_char(int pos, char c);

    // throws if already finalized, if the equation has blanks or any tile is unset
    void finalize(const Tiles& t);

    std::string to_string() const;
    bool operator==(const Guess& r) const;

    static char code_of_tile(Tile t);
    // throws on an unknown code
    static Tile tile_of_code(char c);

    static const char correct_char;
    static const char present_char;
    static const char absent_char;
    static const char unset_char;

    static void test();
private:
    int count(Tile t) const;

    Equation equation;
    Tiles tiles;
};

// terminal colours for a tile, ansi_reset after
const char* ansi_colour(Tile t);
extern const char* const ansi_reset;

std::ostream& operator<<(std::ostream& os, Tile t);
std::ostream& operator<<(std::ostream& os, const Guess& x);

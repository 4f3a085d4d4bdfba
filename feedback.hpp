/* Scoring a guess against the answer, and folding scored guesses into the
   keyboard's per-character feedback.

   These are plain functions over data the caller owns. The frequency table is
   consumed while scoring (each correct or present tile uses up one occurrence
   of its character in the answer) which is what keeps duplicates honest: a
   character is never marked correct or present more often than it appears in
   the answer.
*/

#pragma once
#include <map>
#include <string>
#include "equation.hpp"
#include "guess.hpp"

namespace Feedback {
    typedef std::map<char, int> FrequencyTable;
    typedef std::map<char, Tile> KeyFeedback;

    // occurrences of each character in [answer], blanks excluded
    FrequencyTable count_frequencies(const Equation& answer);

    // Pass 1 marks exact positions, pass 2 marks misplaced characters while
    // [remaining] still has some left. [remaining] should start as
    // count_frequencies(answer). Blanks in [guess] stay unset.
    Guess::Tiles score(const Equation& answer, const Equation& guess, FrequencyTable& remaining);
    Guess::Tiles score(const Equation& answer, const Equation& guess);

    // correct > present > absent, never downgrades. Unset is ignored.
    void update_key(KeyFeedback& keys, char c, Tile t);
    void update_keys(KeyFeedback& keys, const Guess& g);

    // format is "1.2~+_", each character followed by its tile code
    std::string to_string(const KeyFeedback& keys);
    // throws on malformed text
    KeyFeedback key_feedback_of_string(const std::string& s);

    void test();
}

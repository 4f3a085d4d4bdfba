/* One day's game: six rows, a cursor, and the keyboard feedback built up
   from the rows submitted so far.

   Player input never throws. Each command returns a Status, anything other
   than Status::accepted means nothing changed. The Session doesn't know about
   days or the store, the Engine decides when to create, restore and persist it.
*/

#pragma once
#include <array>
#include <string>
#include <vector>
#include <iostream>
#include "equation.hpp"
#include "guess.hpp"
#include "feedback.hpp"

enum class Status
    { accepted,
      incomplete_input,
      malformed_equation,
      arithmetic_mismatch,
      session_terminal,
      already_played_today,
      invalid_character,
      row_full,
      nothing_to_delete };

// what to tell the player
const char* status_message(Status s);
std::ostream& operator<<(std::ostream& os, Status s);

class Session {
public:
    static const int max_guesses = 6;
    typedef std::array<Guess, max_guesses> Guesses;

    enum class State
        { in_progress,
          won,
          lost };

    explicit Session(const Equation& answer_);

    Status insert_character(char c);
    Status delete_character();
    // validates the current row, then scores it
    Status submit_guess();

    State get_state() const;
    bool is_terminal() const;
    // 0..max_guesses, max_guesses once every row is used
    int get_row() const;
    // 0..Equation::length
    int get_column() const;
    // rows submitted
    int tries_used() const;
    const Guesses& get_guesses() const;
    const Feedback::KeyFeedback& get_key_feedback() const;
    const Equation& get_answer() const;

    // Rebuilds saved progress. Every submitted row is scored again against our
    // answer, returns false (and leaves the session as it was) if anything
    // doesn't line up.
    bool restore(const std::vector<Guess>& saved, int row_, int column_, const Feedback::KeyFeedback& keys_);

    // the rows in Guess text form joined by '|'
    static std::string guesses_to_string(const Guesses& g);
    // throws on malformed text or the wrong number of rows
    static std::vector<Guess> guesses_of_string(const std::string& s);

    static void test();
private:
    Equation answer;
    Guesses guesses;
    int row;
    int column;
    Feedback::KeyFeedback keys;
};

std::ostream& operator<<(std::ostream& os, Session::State s);

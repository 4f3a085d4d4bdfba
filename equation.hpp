/* Represents an eight-character equation, either the day's answer or a guess
   being typed. Characters are digits, the four operators and '='. A guess that
   is still being typed holds Equation::blank in the positions not filled yet.

   Equation does not know whether it is arithmetically valid, that is the job of
   the Validator. It only guarantees the length and the alphabet.
*/

#pragma once
#include <string>
#include <iostream>

class Equation {
public:
    static const int length = 8;
    static const char blank;

    // all blanks
    Equation();

    // throws if r is not exactly [length] characters from the alphabet (blanks allowed)
    Equation(const std::string& r);

    bool operator==(const Equation& r) const;
    bool operator!=(const Equation& r) const;
    char operator[](int pos) const { return chars[pos]; }

    // c must be in the alphabet or blank
    void set(int pos, char c);

    bool is_complete() const;
    int count(char c) const;
    std::string to_string() const;

    static bool is_digit(char c);
    static bool is_operator(char c);
    // digit, operator or '='
    static bool is_symbol(char c);

    friend std::ostream& operator<<(std::ostream& os, const Equation& x);

    static void test();
private:
    char chars[length];
};

std::ostream& operator<<(std::ostream& os, const Equation& x);

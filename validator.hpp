#pragma once
#include <string>
#include <vector>
#include "equation.hpp"

/* Decides whether a typed row may be scored. Rules short-circuit in order:
   length, grammar, number parsing, operator count, left-to-right evaluation.
   Each failure maps to its own Verdict so the player can tell "not finished
   typing" from "typed something that isn't an equation" from "the maths is wrong".
*/
namespace Validator {
    enum class Verdict
        { valid,
          incomplete,
          malformed,
          arithmetic_mismatch };

    // operands and operators of the left-hand side, and the stated result
    struct Parsed {
        std::vector<long long> operands;
        std::string operators;
        long long result;
    };

    // Grammar is digits (operator digits)+ = digits, spaces ignored. Returns
    // false if [candidate] doesn't match or a number doesn't parse, [out] is
    // then in an unspecified state.
    bool parse(const std::string& candidate, Parsed& out);

    // Strictly left to right, no precedence. Returns false on a zero divisor or
    // a division that isn't exact, otherwise [out] holds the value.
    bool evaluate(const std::vector<long long>& operands, const std::string& operators, long long& out);

    Verdict check(const std::string& candidate);
    Verdict check(const Equation& e);
    bool is_valid(const Equation& e);

    const char* message(Verdict v);

    std::ostream& operator<<(std::ostream& os, Verdict v);

    void test();
}

#include <sstream>
#include <algorithm>
#include <stdexcept>
#include "equation.hpp"

const int Equation::length;
const char Equation::blank = ' ';

Equation::Equation() {
    std::fill(chars, chars + length, blank);
}

Equation::Equation(const std::string& r) {
    if (r.length() != static_cast<size_t>(length)) {
        throw std::runtime_error("Expected 8 character equation, not: '" + r + "'");
    }
    for (int i = 0; i < length; i++) {
        if (r[i] != blank && !is_symbol(r[i])) {
            throw std::runtime_error("Bad character in equation: '" + r + "'");
        }
        chars[i] = r[i];
    }
}

bool Equation::operator==(const Equation& r) const {
    return std::equal(chars, chars + length, r.chars);
}

bool Equation::operator!=(const Equation& r) const {
    return !(*this == r);
}

void Equation::set(int pos, char c) {
    if (pos < 0 || pos >= length) {
        throw std::runtime_error("Equation::set position out of range");
    }
    if (c != blank && !is_symbol(c)) {
        throw std::runtime_error(std::string("Equation::set bad character: ") + c);
    }
    chars[pos] = c;
}

bool Equation::is_complete() const {
    return std::find(chars, chars + length, blank) == chars + length;
}

int Equation::count(char c) const {
    return std::count(chars, chars + length, c);
}

std::string Equation::to_string() const {
    return std::string(chars, length);
}

bool Equation::is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool Equation::is_operator(char c) {
    return c == '+' || c == '-' || c == '*' || c == '/';
}

bool Equation::is_symbol(char c) {
    return is_digit(c) || is_operator(c) || c == '=';
}

std::ostream& operator<<(std::ostream& os, const Equation& x) {
    return os.write(x.chars, Equation::length);
}

void Equation::test() {
    std::stringstream output;
    std::stringstream expected;

    Equation e("12+57=69");
    Equation b;
    Equation t("10*2    ");
    output << e << "|" << e.is_complete() << " "
           << b << "|" << b.is_complete() << " "
           << t << "|" << t.is_complete() << " "
           << e.count('6') << e.count('=') << t.count(blank) << " "
           << (e == Equation("12+57=69")) << (e != t)
           << std::endl;

    b.set(0, '9');
    b.set(1, '/');
    b.set(7, '=');
    output << b << "|" << std::endl;

    expected << "12+57=69|1 " << "        |0 " << "10*2    |0 "
             << "114 " << "11" << std::endl
             << "9/     =|" << std::endl;

    std::string output_str = output.str();
    std::string expected_str = expected.str();
    if (output_str != expected_str) {
        throw std::runtime_error("Equation::test() 1 failed, got " + output_str + ", but expected " + expected_str);
    }

    int rejected = 0;
    const char* bad[] = { "12+57=6", "12+57=690", "12+57=6x", "12%57=69" };
    for (const char* s : bad) {
        try {
            Equation x(s);
        } catch (const std::runtime_error&) {
            rejected++;
        }
    }
    try {
        b.set(8, '1');
    } catch (const std::runtime_error&) {
        rejected++;
    }
    try {
        b.set(2, 'a');
    } catch (const std::runtime_error&) {
        rejected++;
    }
    if (rejected != 6) {
        throw std::runtime_error("Equation::test() 2 failed, only rejected " + std::to_string(rejected) + " of 6 bad inputs");
    }
}

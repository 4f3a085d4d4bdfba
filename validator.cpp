#include <sstream>
#include <stdexcept>
#include <boost/lexical_cast.hpp>
#include "validator.hpp"

using std::string;
using std::vector;

namespace Validator {
    // internal to this file
    static bool all_digits(const string& s) {
        if (s.empty()) return false;
        for (char c : s) {
            if (!Equation::is_digit(c)) return false;
        }
        return true;
    }

    static bool to_number(const string& s, long long& out) {
        try {
            out = boost::lexical_cast<long long>(s);
        } catch (const boost::bad_lexical_cast&) {
            return false;
        }
        return out >= 0;
    }

    bool parse(const string& candidate, Parsed& out) {
        string clean;
        for (char c : candidate) {
            if (c != ' ') clean += c;
        }

        size_t eq = clean.find('=');
        if (eq == string::npos || clean.find('=', eq + 1) != string::npos) return false;
        string rhs = clean.substr(eq + 1);
        if (!all_digits(rhs)) return false;

        out.operands.clear();
        out.operators.clear();
        string operand;
        for (size_t i = 0; i < eq; i++) {
            char c = clean[i];
            if (Equation::is_digit(c)) {
                operand += c;
            } else if (Equation::is_operator(c)) {
                if (operand.empty()) return false;
                long long v;
                if (!to_number(operand, v)) return false;
                out.operands.push_back(v);
                out.operators += c;
                operand.clear();
            } else {
                return false;
            }
        }
        if (!all_digits(operand) || out.operators.empty()) return false;
        long long last;
        if (!to_number(operand, last)) return false;
        out.operands.push_back(last);

        if (out.operators.size() + 1 != out.operands.size()) return false;
        return to_number(rhs, out.result);
    }

    bool evaluate(const vector<long long>& operands, const string& operators, long long& out) {
        if (operands.empty() || operators.size() + 1 != operands.size()) {
            throw std::runtime_error("Validator::evaluate needs one more operand than operators");
        }
        long long current = operands[0];
        for (size_t i = 0; i < operators.size(); i++) {
            long long next = operands[i + 1];
            switch (operators[i]) {
            case '+': current += next; break;
            case '-': current -= next; break;
            case '*': current *= next; break;
            case '/':
                if (next == 0 || current % next != 0) return false;
                current /= next;
                break;
            default:
                throw std::runtime_error(string("Validator::evaluate unknown operator: ") + operators[i]);
            }
        }
        out = current;
        return true;
    }

    Verdict check(const string& candidate) {
        if (candidate.length() != static_cast<size_t>(Equation::length)) return Verdict::incomplete;

        Parsed p;
        if (!parse(candidate, p)) return Verdict::malformed;

        long long value;
        if (!evaluate(p.operands, p.operators, value)) return Verdict::arithmetic_mismatch;
        return value == p.result ? Verdict::valid : Verdict::arithmetic_mismatch;
    }

    Verdict check(const Equation& e) {
        return check(e.to_string());
    }

    bool is_valid(const Equation& e) {
        return check(e) == Verdict::valid;
    }

    const char* message(Verdict v) {
        switch (v) {
        case Verdict::valid:               return "Valid equation.";
        case Verdict::incomplete:          return "Complete the equation first!";
        case Verdict::malformed:           return "Invalid equation!";
        case Verdict::arithmetic_mismatch: return "The equation doesn't add up!";
        }
        return "";
    }

    std::ostream& operator<<(std::ostream& os, Verdict v) {
        switch (v) {
        case Verdict::valid:               return os << "valid";
        case Verdict::incomplete:          return os << "incomplete";
        case Verdict::malformed:           return os << "malformed";
        case Verdict::arithmetic_mismatch: return os << "arithmetic_mismatch";
        }
        return os;
    }

    void test() {
        std::stringstream output1;
        std::stringstream expected1;

        const char* candidates[] =
            { "12+57=69", // fine
              "10+10=21", // wrong result
              "10+2-3=9",
              "2+3*4=20", // left to right, not precedence
              "2+3*4=14",
              "18/2*1=9",
              "9/2*2=9 ", // inexact division
              "9/0+1=10", // zero divisor
              "01+01=2 ", // leading zeros are numbers too
              "0-5+6=1 ", // negative along the way is fine
              "12+57=6",  // short
              "12+57=690",
              "1257=69 ", // no operator
              "12+57==6",
              "+12+5=17",
              "12+-5=17",
              "12+57=  ",
              "12+5=6+2",
              "1 + 2=3 " };
        for (const char* c : candidates) {
            output1 << "[" << c << "] " << check(string(c)) << std::endl;
        }

        expected1 << "[12+57=69] valid" << std::endl
                  << "[10+10=21] arithmetic_mismatch" << std::endl
                  << "[10+2-3=9] valid" << std::endl
                  << "[2+3*4=20] valid" << std::endl
                  << "[2+3*4=14] arithmetic_mismatch" << std::endl
                  << "[18/2*1=9] valid" << std::endl
                  << "[9/2*2=9 ] arithmetic_mismatch" << std::endl
                  << "[9/0+1=10] arithmetic_mismatch" << std::endl
                  << "[01+01=2 ] valid" << std::endl
                  << "[0-5+6=1 ] valid" << std::endl
                  << "[12+57=6] incomplete" << std::endl
                  << "[12+57=690] incomplete" << std::endl
                  << "[1257=69 ] malformed" << std::endl
                  << "[12+57==6] malformed" << std::endl
                  << "[+12+5=17] malformed" << std::endl
                  << "[12+-5=17] malformed" << std::endl
                  << "[12+57=  ] malformed" << std::endl
                  << "[12+5=6+2] malformed" << std::endl
                  << "[1 + 2=3 ] valid" << std::endl;

        string output1_str = output1.str();
        string expected1_str = expected1.str();
        if (output1_str != expected1_str) {
            throw std::runtime_error("Validator::test() 1 failed, got\n" + output1_str + ", but expected\n" + expected1_str);
        }

        std::stringstream output2;
        std::stringstream expected2;
        Parsed p;
        bool parsed = parse("99-90=09", p);
        output2 << parsed << " ";
        for (long long v : p.operands) output2 << v << ",";
        output2 << p.operators << " " << p.result << std::endl;
        long long v = -1;
        bool ok = evaluate({ 7 }, "", v);
        output2 << ok << " " << v << std::endl;
        ok = evaluate({ 8, 0 }, "/", v);
        output2 << ok << " " << v << std::endl;
        output2 << is_valid(Equation("10+2-3=9")) << is_valid(Equation("10+2-3=8")) << std::endl;

        expected2 << "1 99,90,- 9" << std::endl;
        expected2 << "1 7" << std::endl;
        expected2 << "0 7" << std::endl;
        expected2 << "10" << std::endl;

        string output2_str = output2.str();
        string expected2_str = expected2.str();
        if (output2_str != expected2_str) {
            throw std::runtime_error("Validator::test() 2 failed, got\n" + output2_str + ", but expected\n" + expected2_str);
        }
    }
}

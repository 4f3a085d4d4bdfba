#include <sstream>
#include <stdexcept>
#include "generator.hpp"
#include "validator.hpp"

using std::string;
using std::vector;

namespace Generator {
    const vector<string> fallback_pool =
        { "10+10=20",
          "50-10=40",
          "10+2-3=9",
          "18/2*1=9" };

    static const char operators[] = { '+', '-', '*', '/' };

    Mt_random_source::Mt_random_source() : engine(std::random_device()()) {}
    Mt_random_source::Mt_random_source(unsigned int seed) : engine(seed) {}

    int Mt_random_source::uniform(int lo, int hi) {
        std::uniform_int_distribution<int> dist(lo, hi);
        return dist(engine);
    }

    // internal to this file. Returns false for a zero divisor or inexact division.
    static bool apply(int lhs, char op, int rhs, int& out) {
        switch (op) {
        case '+': out = lhs + rhs; return true;
        case '-': out = lhs - rhs; return true;
        case '*': out = lhs * rhs; return true;
        case '/':
            if (rhs == 0 || lhs % rhs != 0) return false;
            out = lhs / rhs;
            return true;
        }
        return false;
    }

    bool try_generate(Random_source& rng, string& out) {
        std::stringstream ss;
        if (rng.uniform(1, 2) == 1) {
            // AA+BB=CC or AA-BB=CC
            char op = operators[rng.uniform(0, 1)];
            int a;
            int b;
            if (op == '+') {
                a = rng.uniform(10, 49);
                b = rng.uniform(10, 99 - a);
            } else {
                a = rng.uniform(20, 99);
                b = rng.uniform(10, a - 10);
            }
            int c = (op == '+') ? a + b : a - b;
            ss << a << op << b << '=' << c;
        } else {
            // AAoBoC=D, single digit result
            int a = rng.uniform(10, 99);
            char op1 = operators[rng.uniform(0, 3)];
            int b = rng.uniform(0, 9);
            int step1;
            if (!apply(a, op1, b, step1) || step1 < 0) return false;

            char op2 = operators[rng.uniform(0, 3)];
            int c = rng.uniform(0, 9);
            int step2;
            if (!apply(step1, op2, c, step2) || step2 < 0 || step2 > 9) return false;
            ss << a << op1 << b << op2 << c << '=' << step2;
        }

        string candidate = ss.str();
        if (candidate.length() != static_cast<size_t>(Equation::length)) return false;
        out = candidate;
        return true;
    }

    Equation generate(Random_source& rng, int attempts, int* attempts_used) {
        string candidate;
        for (int i = 1; i <= attempts; i++) {
            if (try_generate(rng, candidate)) {
                if (attempts_used) *attempts_used = i;
                return Equation(candidate);
            }
        }
        if (attempts_used) *attempts_used = -1;
        return Equation(fallback_pool[rng.uniform(0, static_cast<int>(fallback_pool.size()) - 1)]);
    }

    //////////////////
    // test helpers

    // always the low end of the range
    class Low_random_source : public Random_source {
    public:
        virtual int uniform(int lo, int hi) { return lo; }
    };

    // always the high end of the range. Every two-operator draw is 99/9/9 which
    // is rejected, so generate() always falls back.
    class High_random_source : public Random_source {
    public:
        virtual int uniform(int lo, int hi) { return hi; }
    };

    // plays back a fixed list of draws
    class Scripted_random_source : public Random_source {
    public:
        Scripted_random_source(const vector<int>& draws_) : draws(draws_), next(0) {}
        virtual int uniform(int lo, int hi) {
            if (next >= draws.size()) throw std::runtime_error("Scripted_random_source ran out of draws");
            int v = draws[next++];
            if (v < lo || v > hi) {
                throw std::runtime_error("Scripted_random_source draw " + std::to_string(v) + " out of range");
            }
            return v;
        }
    private:
        vector<int> draws;
        size_t next;
    };

    void test() {
        std::stringstream output;
        std::stringstream expected;
        int used = 0;

        Low_random_source low;
        Equation e_low = generate(low, max_attempts, &used);
        output << e_low << " " << used << std::endl;

        High_random_source high;
        Equation e_high = generate(high, max_attempts, &used);
        output << e_high << " " << used << std::endl;

        Scripted_random_source s1({ 1, 0, 12, 57 });
        Equation e_s1 = generate(s1, max_attempts, &used);
        output << e_s1 << " " << used << std::endl;

        // 50+5+1 = 56 is too big, then 99-10
        Scripted_random_source s2({ 2, 50, 0, 5, 0, 1,
                                    1, 1, 99, 10 });
        Equation e_s2 = generate(s2, max_attempts, &used);
        output << e_s2 << " " << used << std::endl;

        // 72/0 is rejected before op2 is drawn
        Scripted_random_source s3({ 2, 72, 3, 0,
                                    2, 10, 0, 2, 1, 3 });
        Equation e_s3 = generate(s3, max_attempts, &used);
        output << e_s3 << " " << used << std::endl;

        // 3 attempts all rejected, then the pool
        Scripted_random_source s4({ 2, 10, 1, 0, 0, 9,
                                    2, 99, 2, 9, 0, 0,
                                    2, 97, 3, 2,
                                    1 });
        Equation e_s4 = generate(s4, 3, &used);
        output << e_s4 << " " << used << std::endl;

        expected << "10+10=20 1" << std::endl;
        expected << "18/2*1=9 -1" << std::endl;
        expected << "12+57=69 1" << std::endl;
        expected << "99-10=89 2" << std::endl;
        expected << "10+2-3=9 2" << std::endl;
        expected << "50-10=40 -1" << std::endl;

        string output_str = output.str();
        string expected_str = expected.str();
        if (output_str != expected_str) {
            throw std::runtime_error("Generator::test() 1 failed, got\n" + output_str + ", but expected\n" + expected_str);
        }

        for (const string& e : fallback_pool) {
            if (!Validator::is_valid(Equation(e))) {
                throw std::runtime_error("Generator::test() 2 failed, fallback " + e + " is not valid");
            }
        }

        // everything generated must pass the validator
        Mt_random_source rng(2024);
        int fallbacks = 0;
        for (int i = 0; i < 5000; i++) {
            Equation e = generate(rng, max_attempts, &used);
            if (used < 0) fallbacks++;
            if (!e.is_complete() || e.count('=') != 1 || !Validator::is_valid(e)) {
                throw std::runtime_error("Generator::test() 3 failed, generated invalid " + e.to_string());
            }
        }
        if (fallbacks > 0) {
            throw std::runtime_error("Generator::test() 4 failed, fell back " + std::to_string(fallbacks) + " times");
        }
    }
}

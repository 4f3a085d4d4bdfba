#include "self_test.hpp"
#include "equation.hpp"
#include "guess.hpp"
#include "feedback.hpp"
#include "validator.hpp"
#include "generator.hpp"
#include "calendar.hpp"
#include "store.hpp"
#include "stats.hpp"
#include "daily_gate.hpp"
#include "session.hpp"
#include "engine.hpp"

void run_all_tests() {
    Equation::test();
    Guess::test();
    Feedback::test();
    Validator::test();
    Generator::test();
    Calendar::test();
    Store::test();
    Stats::test();
    Streak_tracker::test();
    Daily_gate::test();
    Session::test();
    Engine::test();
}

#include <sstream>
#include <stdexcept>
#include "daily_gate.hpp"
#include "validator.hpp"

using std::string;
using std::cerr;
using std::endl;
using Calendar::Day;
namespace Keys = Store::Keys;

Daily_gate::Daily_gate(Store::Store_intf& store_) : store(store_) {}

bool Daily_gate::can_play_today(Day today) const {
    Day completed;
    return !(store.get_day(Keys::last_completed_date, completed) && completed == today);
}

bool Daily_gate::cached_answer(Day today, Equation& answer) const {
    Day generated;
    if (!store.get_day(Keys::last_equation_date, generated) || generated != today) {
        return false;
    }
    string s;
    if (!store.get(Keys::daily_equation, s)) {
        if (!Store::silence) cerr << "No cached equation for " << Calendar::to_string(today) << endl;
        return false;
    }
    try {
        Equation e(s);
        if (!Validator::is_valid(e)) {
            if (!Store::silence) cerr << "Cached equation doesn't hold: " << e << endl;
            return false;
        }
        answer = e;
    } catch (const std::runtime_error& e) {
        if (!Store::silence) cerr << "Unreadable cached equation: " << e.what() << endl;
        return false;
    }
    return true;
}

void Daily_gate::roll_over(Day today, const Equation& answer) {
    Store::Batch b;
    b.set(Keys::daily_equation, answer.to_string());
    b.set(Keys::last_equation_date, today);
    // a same-day regeneration (the cache was unreadable) doesn't reopen a finished puzzle
    if (can_play_today(today)) b.remove(Keys::last_completed_date);
    b.remove(Keys::saved_guesses);
    b.remove(Keys::guess_index);
    b.remove(Keys::char_index);
    b.remove(Keys::key_colors);
    b.remove(Keys::last_played_date);
    store.apply(b);
}

void Daily_gate::mark_completed(Day today) {
    Store::Batch b;
    b.set(Keys::last_completed_date, today);
    store.apply(b);
}

void Daily_gate::test() {
    Store::Silencer quiet(Store::silence);
    std::stringstream output1;
    std::stringstream expected1;

    Store::Memory_store ms;
    Daily_gate gate(ms);
    Day d1 = Calendar::day_of_string("2024-03-01");
    Day d2 = d1 + boost::gregorian::days(1);
    Equation e;

    output1 << gate.cached_answer(d1, e) << " " << gate.can_play_today(d1) << " ";
    gate.roll_over(d1, Equation("12+57=69"));
    bool cached = gate.cached_answer(d1, e);
    output1 << cached << " " << e << " " << gate.cached_answer(d2, e) << endl;

    // progress saved during the day, then the day is completed
    ms.set(Keys::saved_guesses, "anything");
    ms.set(Keys::last_played_date, "2024-03-01");
    ms.set(Keys::total_played, "9");
    gate.mark_completed(d1);
    output1 << gate.can_play_today(d1) << " " << gate.can_play_today(d2) << endl;

    // the next day clears completion and progress but keeps stats
    gate.roll_over(d2, Equation("10+2-3=9"));
    string s;
    ms.get(Keys::last_equation_date, s);
    output1 << s << " " << gate.can_play_today(d2) << " "
            << ms.has(Keys::last_completed_date) << ms.has(Keys::saved_guesses)
            << ms.has(Keys::last_played_date) << ms.has(Keys::total_played) << endl;

    // a cached answer that can't be used
    ms.set(Keys::daily_equation, "12+57=70");
    output1 << gate.cached_answer(d2, e) << " ";
    ms.set(Keys::daily_equation, "garbage");
    output1 << gate.cached_answer(d2, e) << " ";
    ms.remove(Keys::daily_equation);
    output1 << gate.cached_answer(d2, e) << " ";
    ms.set(Keys::daily_equation, "50-10=40");
    ms.set(Keys::last_equation_date, "not a date");
    output1 << gate.cached_answer(d2, e) << " ";
    ms.set(Keys::last_equation_date, "2024-03-02");
    cached = gate.cached_answer(d2, e);
    output1 << cached << " " << e << endl;

    // regenerating a finished day keeps it finished
    gate.mark_completed(d2);
    gate.roll_over(d2, Equation("18/2*1=9"));
    cached = gate.cached_answer(d2, e);
    output1 << gate.can_play_today(d2) << " " << cached << " " << e << endl;

    expected1 << "0 1 1 12+57=69 0" << endl;
    expected1 << "0 1" << endl;
    expected1 << "2024-03-02 1 0001" << endl;
    expected1 << "0 0 0 0 1 50-10=40" << endl;
    expected1 << "0 1 18/2*1=9" << endl;

    string output1_str = output1.str();
    string expected1_str = expected1.str();
    if (output1_str != expected1_str) {
        throw std::runtime_error("Daily_gate::test() 1 failed, got\n" + output1_str + ", but expected\n" + expected1_str);
    }
}

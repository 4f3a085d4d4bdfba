#include <sstream>
#include <stdexcept>
#include "engine.hpp"

using std::string;
using std::vector;
using std::cerr;
using std::endl;
using Calendar::Day;
namespace Keys = Store::Keys;

bool Engine::silence = false;

Engine::Engine(Store::Store_intf& store_, const Calendar::Clock& clock_, Generator::Random_source& rng_) :
    store(store_),
    clock(clock_),
    rng(rng_),
    gate(store_),
    tracker(store_),
    last_write_ok(true) {}

void Engine::refresh() {
    Day today = Calendar::today(clock);
    if (session && today == day) return;
    if (session && !silence) {
        cerr << "Day changed from " << Calendar::to_string(day) << " to " << Calendar::to_string(today) << endl;
    }
    load(today);
}

void Engine::load(Day today) {
    day = today;
    Equation answer;
    if (gate.cached_answer(today, answer)) {
        session = std::make_unique<Session>(answer);
        resume();
        return;
    }

    int attempts = 0;
    answer = Generator::generate(rng, Generator::max_attempts, &attempts);
    if (!silence) {
        cerr << "New puzzle for " << Calendar::to_string(today);
        if (attempts < 0) {
            cerr << " from the fallback pool" << endl;
        } else {
            cerr << " after " << attempts << " attempt(s)" << endl;
        }
    }
    session = std::make_unique<Session>(answer);
    try {
        gate.roll_over(today, answer);
        last_write_ok = true;
    } catch (const std::runtime_error& e) {
        write_failed("the new puzzle", e);
    }
}

void Engine::resume() {
    Day played;
    if (!store.get_day(Keys::last_played_date, played) || played != day) return;

    string text;
    string key_text;
    int row = 0;
    int column = 0;
    if (!store.get(Keys::saved_guesses, text) ||
        !store.get(Keys::key_colors, key_text) ||
        !store.get_int(Keys::guess_index, row) ||
        !store.get_int(Keys::char_index, column)) {
        if (!silence) cerr << "Saved progress for " << Calendar::to_string(day) << " is incomplete, starting fresh" << endl;
        return;
    }

    try {
        vector<Guess> saved = Session::guesses_of_string(text);
        Feedback::KeyFeedback keys = Feedback::key_feedback_of_string(key_text);
        if (!session->restore(saved, row, column, keys)) {
            if (!silence) cerr << "Saved progress doesn't match today's puzzle, starting fresh" << endl;
            return;
        }
    } catch (const std::runtime_error& e) {
        if (!silence) cerr << "Unreadable saved progress, starting fresh: " << e.what() << endl;
        return;
    }
    if (!silence) {
        cerr << "Resumed " << Calendar::to_string(day) << " at row " << row << ", column " << column << endl;
    }
}

void Engine::write_failed(const char* what, const std::exception& e) {
    last_write_ok = false;
    if (!silence) cerr << "Couldn't save " << what << ": " << e.what() << endl;
}

void Engine::save_progress() {
    Store::Batch b;
    b.set(Keys::saved_guesses, Session::guesses_to_string(session->get_guesses()));
    b.set(Keys::guess_index, session->get_row());
    b.set(Keys::char_index, session->get_column());
    b.set(Keys::key_colors, Feedback::to_string(session->get_key_feedback()));
    b.set(Keys::last_played_date, day);
    try {
        store.apply(b);
        last_write_ok = true;
    } catch (const std::runtime_error& e) {
        write_failed("progress", e);
    }
}

void Engine::on_terminal() {
    bool won = session->get_state() == Session::State::won;
    // stats first, the completion marker is what stops a retry
    try {
        tracker.on_session_terminal(won, session->tries_used(), day);
        gate.mark_completed(day);
        last_write_ok = true;
    } catch (const std::runtime_error& e) {
        write_failed("the finished game", e);
    }
    if (!silence) {
        if (won) {
            cerr << "Won in " << session->tries_used() << endl;
        } else {
            cerr << "Lost, the answer was " << session->get_answer() << endl;
        }
    }
}

Status Engine::start() {
    refresh();
    if (session->is_terminal() && gate.can_play_today(day)) {
        // finished but never recorded, the write must have failed
        on_terminal();
    }
    return gate.can_play_today(day) ? Status::accepted : Status::already_played_today;
}

bool Engine::can_play_today() {
    refresh();
    return gate.can_play_today(day);
}

Status Engine::check_playable() {
    refresh();
    if (session->is_terminal()) return Status::session_terminal;
    if (!gate.can_play_today(day)) return Status::already_played_today;
    return Status::accepted;
}

Status Engine::insert_character(char c) {
    Status st = check_playable();
    if (st != Status::accepted) return st;
    st = session->insert_character(c);
    if (st == Status::accepted) save_progress();
    return st;
}

Status Engine::delete_character() {
    Status st = check_playable();
    if (st != Status::accepted) return st;
    st = session->delete_character();
    if (st == Status::accepted) save_progress();
    return st;
}

Status Engine::submit_guess() {
    Status st = check_playable();
    if (st != Status::accepted) return st;
    st = session->submit_guess();
    if (st == Status::accepted) {
        save_progress();
        if (session->is_terminal()) on_terminal();
    }
    return st;
}

Engine::Snapshot Engine::current_state() {
    refresh();
    Snapshot s;
    s.guesses = session->get_guesses();
    s.row = session->get_row();
    s.column = session->get_column();
    s.terminal = session->is_terminal();
    s.state = session->get_state();
    s.key_feedback = session->get_key_feedback();
    return s;
}

Stats Engine::stats() const {
    return Stats::load(store);
}

boost::posix_time::time_duration Engine::time_until_next_puzzle() const {
    return Calendar::time_until_next_day(clock.now());
}

const Equation& Engine::get_answer() {
    refresh();
    return session->get_answer();
}

Day Engine::get_day() {
    refresh();
    return day;
}

bool Engine::persisted() const { return last_write_ok; }

//////////////////
// test helpers

// always the low end, every new puzzle is 10+10=20
class Lowest_random_source : public Generator::Random_source {
public:
    virtual int uniform(int lo, int hi) { return lo; }
};

// a Memory_store whose writes can be made to fail
class Failing_store : public Store::Memory_store {
public:
    Failing_store() : failing(false) {}
    virtual void apply(const Store::Batch& b) {
        if (failing) throw std::runtime_error("disk full");
        Memory_store::apply(b);
    }
    bool failing;
};

static Status type(Engine& e, const string& s) {
    for (char c : s) {
        Status st = e.insert_character(c);
        if (st != Status::accepted) return st;
    }
    return Status::accepted;
}

static Status play(Engine& e, const string& s) {
    Status st = type(e, s);
    if (st != Status::accepted) return st;
    return e.submit_guess();
}

static string describe(Engine& e) {
    Engine::Snapshot s = e.current_state();
    std::stringstream ss;
    ss << s.row << " " << s.column << " " << s.state << " " << s.terminal;
    return ss.str();
}

void Engine::test() {
    using boost::posix_time::hours;
    using boost::posix_time::time_from_string;
    Store::Silencer quiet(silence);
    Store::Silencer quiet_store(Store::silence);

    std::stringstream output1;
    std::stringstream expected1;
    Status st;
    string s;

    Store::Memory_store ms;
    ms.set(Keys::daily_equation, "12+57=69");
    ms.set(Keys::last_equation_date, "2024-03-01");
    Calendar::Fixed_clock clock(time_from_string("2024-03-01 09:00:00"));
    Lowest_random_source rng;

    // progress survives a restart the same day
    {
        Engine e1(ms, clock, rng);
        output1 << e1.start() << " ";
        output1 << play(e1, "10+10=20") << " ";
        output1 << type(e1, "50") << " ";
        output1 << describe(e1) << " " << e1.persisted() << endl;
    }
    Engine e2(ms, clock, rng);
    st = e2.start();
    Snapshot snap = e2.current_state();
    output1 << st << " " << describe(e2) << " " << snap.guesses[0].to_string()
            << " [" << snap.guesses[1].get_equation() << "] " << Feedback::to_string(snap.key_feedback) << endl;

    e2.delete_character();
    e2.delete_character();
    output1 << play(e2, "12+57=69") << " ";
    output1 << describe(e2) << " " << e2.can_play_today() << " " << e2.stats() << endl;
    output1 << e2.insert_character('1') << " ";
    output1 << e2.submit_guess() << " " << e2.time_until_next_puzzle() << endl;

    // finished for the day, the board is still there
    Engine e3(ms, clock, rng);
    output1 << e3.start() << " ";
    output1 << describe(e3) << " " << e3.get_answer() << " ";
    output1 << e3.insert_character('1') << " ";
    output1 << e3.delete_character() << endl;

    expected1 << "accepted accepted accepted 1 2 in_progress 0 1" << endl;
    expected1 << "accepted 1 2 in_progress 0 10+10=20 ._.__.~_ [50      ] +.0_1.2~=." << endl;
    expected1 << "accepted 2 0 won 1 0 played=1 won=1 streak=1 best=1 fewest=2 dist=0,1,0,0,0,0" << endl;
    expected1 << "session_terminal session_terminal 15:00:00" << endl;
    expected1 << "already_played_today 2 0 won 1 12+57=69 session_terminal session_terminal" << endl;

    string output1_str = output1.str();
    string expected1_str = expected1.str();
    if (output1_str != expected1_str) {
        throw std::runtime_error("Engine::test() 1 failed, got\n" + output1_str + ", but expected\n" + expected1_str);
    }

    // the next day, in the same process and after a restart
    std::stringstream output2;
    std::stringstream expected2;
    clock.advance(hours(24));
    output2 << e3.can_play_today() << " ";
    output2 << describe(e3) << " " << e3.get_answer() << " ";
    ms.get(Keys::last_equation_date, s);
    output2 << s << " " << ms.has(Keys::last_played_date) << ms.has(Keys::last_completed_date) << " "
            << e3.stats() << endl;

    const char* misses[] = { "12+57=69", "50-10=40", "10+2-3=9", "18/2*1=9", "99-90=09", "11+11=22" };
    for (const char* m : misses) {
        output2 << play(e3, m) << " ";
    }
    output2 << describe(e3) << " " << e3.can_play_today() << " " << e3.stats() << endl;

    clock.advance(hours(24));
    Engine e4(ms, clock, rng);
    output2 << e4.start() << " ";
    output2 << play(e4, "10+10=20") << " ";
    output2 << describe(e4) << " " << e4.stats() << endl;

    // won yesterday, wins again today
    clock.advance(hours(24));
    output2 << e4.start() << " ";
    output2 << play(e4, "10+10=20") << " ";
    output2 << Calendar::to_string(e4.get_day()) << " " << e4.stats() << endl;

    expected2 << "1 0 0 in_progress 0 10+10=20 2024-03-02 00 played=1 won=1 streak=1 best=1 fewest=2 dist=0,1,0,0,0,0" << endl;
    expected2 << "accepted accepted accepted accepted accepted accepted 6 0 lost 1 0 "
              << "played=2 won=1 streak=0 best=1 fewest=2 dist=0,1,0,0,0,0" << endl;
    expected2 << "accepted accepted 1 0 won 1 played=3 won=2 streak=1 best=1 fewest=1 dist=1,1,0,0,0,0" << endl;
    expected2 << "accepted accepted 2024-03-04 played=4 won=3 streak=2 best=2 fewest=1 dist=2,1,0,0,0,0" << endl;

    string output2_str = output2.str();
    string expected2_str = expected2.str();
    if (output2_str != expected2_str) {
        throw std::runtime_error("Engine::test() 2 failed, got\n" + output2_str + ", but expected\n" + expected2_str);
    }

    // a corrupt store degrades to defaults
    std::stringstream output3;
    std::stringstream expected3;
    Store::Memory_store bad;
    bad.set(Keys::daily_equation, "12+57=70");
    bad.set(Keys::last_equation_date, "2024-03-04");
    bad.set(Keys::saved_guesses, "junk");
    bad.set(Keys::guess_index, "x");
    bad.set(Keys::char_index, "0");
    bad.set(Keys::key_colors, "??");
    bad.set(Keys::last_played_date, "2024-03-04");
    bad.set(Keys::last_completed_date, "yesterday");
    bad.set(Keys::total_played, "-3");
    bad.set(Keys::win_distribution, "a,b");
    bad.set(Keys::fewest_tries, "99");
    bad.set(Keys::current_streak, "2");
    Engine e5(bad, clock, rng);
    output3 << e5.start() << " ";
    output3 << describe(e5) << " " << e5.get_answer() << " " << e5.stats() << endl;

    // saved progress that doesn't fit the cached answer is dropped
    Store::Memory_store other;
    Session::Guesses rows;
    rows[0] = Guess("10+10=20 ........");
    other.set(Keys::daily_equation, "12+57=69");
    other.set(Keys::last_equation_date, "2024-03-04");
    other.set(Keys::saved_guesses, Session::guesses_to_string(rows));
    other.set(Keys::guess_index, "1");
    other.set(Keys::char_index, "0");
    other.set(Keys::key_colors, "+.0.1.2.=.");
    other.set(Keys::last_played_date, "2024-03-04");
    Engine e6(other, clock, rng);
    output3 << e6.start() << " ";
    output3 << describe(e6) << " " << e6.get_answer() << endl;

    expected3 << "accepted 0 0 in_progress 0 10+10=20 played=0 won=0 streak=2 best=0 fewest=6 dist=0,0,0,0,0,0" << endl;
    expected3 << "accepted 0 0 in_progress 0 12+57=69" << endl;

    string output3_str = output3.str();
    string expected3_str = expected3.str();
    if (output3_str != expected3_str) {
        throw std::runtime_error("Engine::test() 3 failed, got\n" + output3_str + ", but expected\n" + expected3_str);
    }

    // failed writes don't stop the game, and a finished game is recorded later
    std::stringstream output4;
    std::stringstream expected4;
    Failing_store fs;
    fs.failing = true;
    Engine e7(fs, clock, rng);
    output4 << e7.start() << " ";
    output4 << e7.persisted() << " " << fs.size() << " ";
    fs.failing = false;
    output4 << type(e7, "10+10=20") << " ";
    output4 << e7.persisted() << " " << fs.has(Keys::saved_guesses) << " ";
    fs.failing = true;
    output4 << e7.submit_guess() << " ";
    output4 << describe(e7) << " " << e7.persisted() << " " << e7.can_play_today() << " " << e7.stats() << endl;
    fs.failing = false;
    output4 << e7.start() << " ";
    output4 << e7.persisted() << " " << e7.can_play_today() << " " << e7.stats() << endl;

    expected4 << "accepted 0 0 accepted 1 1 accepted 1 0 won 1 0 1 "
              << "played=0 won=0 streak=0 best=0 fewest=6 dist=0,0,0,0,0,0" << endl;
    expected4 << "already_played_today 1 0 played=1 won=1 streak=1 best=1 fewest=1 dist=1,0,0,0,0,0" << endl;

    string output4_str = output4.str();
    string expected4_str = expected4.str();
    if (output4_str != expected4_str) {
        throw std::runtime_error("Engine::test() 4 failed, got\n" + output4_str + ", but expected\n" + expected4_str);
    }

}

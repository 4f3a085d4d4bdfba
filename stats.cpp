#include <sstream>
#include <stdexcept>
#include <algorithm>
#include <boost/lexical_cast.hpp>
#include "stats.hpp"

using std::string;
using std::cerr;
using std::endl;
using Calendar::Day;
namespace Keys = Store::Keys;

const int Stats::max_tries;

Stats::Stats() :
    total_played(0),
    total_won(0),
    current_streak(0),
    best_streak(0),
    fewest_tries(max_tries) {
    win_distribution.fill(0);
}

int Stats::win_percentage() const {
    if (total_played <= 0) return 0;
    return (100 * total_won) / total_played;
}

std::ostream& operator<<(std::ostream& os, const Stats& s) {
    os << "played=" << s.total_played
       << " won=" << s.total_won
       << " streak=" << s.current_streak
       << " best=" << s.best_streak
       << " fewest=" << s.fewest_tries
       << " dist=" << Stats::distribution_to_string(s.win_distribution);
    return os;
}

string Stats::to_string() const {
    std::stringstream ss;
    ss << *this;
    return ss.str();
}

string Stats::distribution_to_string(const Distribution& d) {
    std::stringstream ss;
    for (int i = 0; i < max_tries; i++) {
        if (i > 0) ss << ',';
        ss << d[i];
    }
    return ss.str();
}

Stats::Distribution Stats::distribution_of_string(const string& s) {
    Distribution d;
    d.fill(0);
    std::stringstream ss(s);
    string g;
    int i = 0;
    while (std::getline(ss, g, ',')) {
        if (i >= max_tries) {
            throw std::runtime_error("Too many win distribution entries: '" + s + "'");
        }
        try {
            d[i] = boost::lexical_cast<int>(g);
        } catch (const boost::bad_lexical_cast&) {
            throw std::runtime_error("Bad win distribution entry '" + g + "' in '" + s + "'");
        }
        if (d[i] < 0) {
            throw std::runtime_error("Negative win distribution entry in '" + s + "'");
        }
        i++;
    }
    if (i != max_tries) {
        throw std::runtime_error("Expected " + std::to_string(max_tries) + " win distribution entries, not: '" + s + "'");
    }
    return d;
}

// a counter that must not be negative
static void load_counter(const Store::Store_intf& store, const char* key, int& value) {
    int v;
    if (!store.get_int(key, v)) return;
    if (v < 0) {
        if (!Store::silence) cerr << "Ignoring negative " << key << ": " << v << endl;
        return;
    }
    value = v;
}

Stats Stats::load(const Store::Store_intf& store) {
    Stats s;
    load_counter(store, Keys::total_played, s.total_played);
    load_counter(store, Keys::total_won, s.total_won);
    load_counter(store, Keys::current_streak, s.current_streak);
    load_counter(store, Keys::best_streak, s.best_streak);

    int fewest;
    if (store.get_int(Keys::fewest_tries, fewest)) {
        if (fewest >= 1 && fewest <= max_tries) {
            s.fewest_tries = fewest;
        } else if (!Store::silence) {
            cerr << "Ignoring out of range " << Keys::fewest_tries << ": " << fewest << endl;
        }
    }

    string dist;
    if (store.get(Keys::win_distribution, dist)) {
        try {
            // only replaces the default once the whole list parsed
            Distribution parsed = distribution_of_string(dist);
            s.win_distribution = parsed;
        } catch (const std::runtime_error& e) {
            if (!Store::silence) cerr << "Ignoring " << Keys::win_distribution << ": " << e.what() << endl;
        }
    }
    return s;
}

void Stats::save(Store::Batch& b) const {
    b.set(Keys::total_played, total_played);
    b.set(Keys::total_won, total_won);
    b.set(Keys::win_distribution, distribution_to_string(win_distribution));
    b.set(Keys::current_streak, current_streak);
    b.set(Keys::best_streak, best_streak);
    b.set(Keys::fewest_tries, fewest_tries);
}

void Stats::test() {
    std::stringstream output1;
    std::stringstream expected1;

    Stats s;
    output1 << s << " " << s.win_percentage() << endl;
    s.total_played = 3;
    s.total_won = 2;
    s.win_distribution[1] = 2;
    output1 << s << " " << s.win_percentage() << endl;

    Store::Memory_store ms;
    Store::Batch b;
    s.save(b);
    ms.apply(b);
    output1 << (Stats::load(ms).to_string() == s.to_string()) << endl;

    // corrupt values fall back to the defaults one by one
    {
        Store::Silencer quiet(Store::silence);
        ms.set(Keys::total_played, "many");
        ms.set(Keys::win_distribution, "1,2");
        ms.set(Keys::fewest_tries, "0");
        ms.set(Keys::current_streak, "-4");
        output1 << Stats::load(ms) << endl;

        // a list that breaks part way leaves none of its entries behind
        Store::Memory_store partial;
        partial.set(Keys::win_distribution, "7,8,x,1,1,1");
        output1 << Stats::load(partial) << endl;
        partial.set(Keys::win_distribution, "4,4,4,4,4,4,4");
        output1 << Stats::load(partial) << endl;
    }

    expected1 << "played=0 won=0 streak=0 best=0 fewest=6 dist=0,0,0,0,0,0 0" << endl;
    expected1 << "played=3 won=2 streak=0 best=0 fewest=6 dist=0,2,0,0,0,0 66" << endl;
    expected1 << "1" << endl;
    expected1 << "played=0 won=2 streak=0 best=0 fewest=6 dist=0,0,0,0,0,0" << endl;
    expected1 << "played=0 won=0 streak=0 best=0 fewest=6 dist=0,0,0,0,0,0" << endl;
    expected1 << "played=0 won=0 streak=0 best=0 fewest=6 dist=0,0,0,0,0,0" << endl;

    string output1_str = output1.str();
    string expected1_str = expected1.str();
    if (output1_str != expected1_str) {
        throw std::runtime_error("Stats::test() 1 failed, got\n" + output1_str + ", but expected\n" + expected1_str);
    }

    int rejected = 0;
    const char* bad[] = { "", "1,2,3,4,5", "1,2,3,4,5,6,7", "1,2,x,4,5,6", "1,2,-3,4,5,6" };
    for (const char* d : bad) {
        try {
            distribution_of_string(d);
        } catch (const std::runtime_error&) {
            rejected++;
        }
    }
    if (rejected != 5) {
        throw std::runtime_error("Stats::test() 2 failed, only rejected " + std::to_string(rejected) + " of 5");
    }
}

//////////////////
// Streak_tracker

Streak_tracker::Streak_tracker(Store::Store_intf& store_) : store(store_) {}

bool Streak_tracker::on_session_terminal(bool won, int tries_used, Day today) {
    if (won && (tries_used < 1 || tries_used > Stats::max_tries)) {
        throw std::runtime_error("Won in " + std::to_string(tries_used) + " tries");
    }

    Day last_update;
    if (store.get_day(Keys::last_stats_update, last_update) && last_update == today) {
        if (!Store::silence) cerr << "Stats already updated for " << Calendar::to_string(today) << endl;
        return false;
    }

    Stats s = Stats::load(store);
    Day last_win;
    if (store.get_day(Keys::last_win_date, last_win)) {
        long d = Calendar::days_between(last_win, today);
        if (d == 1) {
            s.current_streak = won ? s.current_streak + 1 : 0;
        } else if (d != 0) {
            s.current_streak = won ? 1 : 0;
        }
    } else {
        s.current_streak = won ? 1 : 0;
    }
    s.best_streak = std::max(s.best_streak, s.current_streak);

    s.total_played++;
    Store::Batch b;
    if (won) {
        if (s.total_won == 0 || tries_used < s.fewest_tries) {
            s.fewest_tries = tries_used;
        }
        s.total_won++;
        s.win_distribution[tries_used - 1]++;
        b.set(Keys::last_win_date, today);
    }
    s.save(b);
    b.set(Keys::last_stats_update, today);
    store.apply(b);

    if (!Store::silence) cerr << "Updated stats for " << Calendar::to_string(today) << ": " << s << endl;
    return true;
}

void Streak_tracker::test() {
    Store::Silencer quiet(Store::silence);
    std::stringstream output1;
    std::stringstream expected1;

    Store::Memory_store ms;
    Streak_tracker tracker(ms);
    bool updated;
    Day d1 = Calendar::day_of_string("2024-02-28");

    updated = tracker.on_session_terminal(true, 3, d1);
    output1 << updated << " " << Stats::load(ms) << endl;
    // reported again the same day
    updated = tracker.on_session_terminal(true, 1, d1);
    output1 << updated << " " << Stats::load(ms) << endl;
    // won yesterday, wins again today, across the leap day
    Day d2 = d1 + boost::gregorian::days(1);
    updated = tracker.on_session_terminal(true, 4, d2);
    output1 << updated << " " << Stats::load(ms) << endl;
    Day d3 = d2 + boost::gregorian::days(1);
    updated = tracker.on_session_terminal(false, 6, d3);
    output1 << updated << " " << Stats::load(ms) << endl;
    // skipped two days, streak restarts
    Day d4 = d3 + boost::gregorian::days(3);
    updated = tracker.on_session_terminal(true, 2, d4);
    output1 << updated << " " << Stats::load(ms) << endl;

    string s;
    ms.get(Keys::last_win_date, s);
    output1 << s << " ";
    ms.get(Keys::last_stats_update, s);
    output1 << s << endl;

    // six misses from a fresh store: one game played, nothing won
    Store::Memory_store lost;
    Streak_tracker lost_tracker(lost);
    updated = lost_tracker.on_session_terminal(false, 6, d1);
    output1 << updated << " " << Stats::load(lost) << " "
            << lost.has(Keys::last_win_date) << endl;

    // already won today but the marker is gone, streak stays put
    Store::Memory_store again;
    again.set(Keys::last_win_date, "2024-02-28");
    again.set(Keys::current_streak, "5");
    again.set(Keys::best_streak, "7");
    Streak_tracker again_tracker(again);
    updated = again_tracker.on_session_terminal(true, 2, d1);
    output1 << updated << " " << Stats::load(again) << endl;

    expected1 << "1 played=1 won=1 streak=1 best=1 fewest=3 dist=0,0,1,0,0,0" << endl;
    expected1 << "0 played=1 won=1 streak=1 best=1 fewest=3 dist=0,0,1,0,0,0" << endl;
    expected1 << "1 played=2 won=2 streak=2 best=2 fewest=3 dist=0,0,1,1,0,0" << endl;
    expected1 << "1 played=3 won=2 streak=0 best=2 fewest=3 dist=0,0,1,1,0,0" << endl;
    expected1 << "1 played=4 won=3 streak=1 best=2 fewest=2 dist=0,1,1,1,0,0" << endl;
    expected1 << "2024-03-04 2024-03-04" << endl;
    expected1 << "1 played=1 won=0 streak=0 best=0 fewest=6 dist=0,0,0,0,0,0 0" << endl;
    expected1 << "1 played=1 won=1 streak=5 best=7 fewest=2 dist=0,1,0,0,0,0" << endl;

    string output1_str = output1.str();
    string expected1_str = expected1.str();
    if (output1_str != expected1_str) {
        throw std::runtime_error("Streak_tracker::test() 1 failed, got\n" + output1_str + ", but expected\n" + expected1_str);
    }

    // a win in an impossible number of tries is a bug, and changes nothing
    Store::Memory_store untouched;
    Streak_tracker untouched_tracker(untouched);
    int rejected = 0;
    try {
        untouched_tracker.on_session_terminal(true, 7, d1);
    } catch (const std::runtime_error&) {
        rejected++;
    }
    try {
        untouched_tracker.on_session_terminal(true, 0, d1);
    } catch (const std::runtime_error&) {
        rejected++;
    }
    if (rejected != 2 || untouched.size() != 0) {
        throw std::runtime_error("Streak_tracker::test() 2 failed");
    }
}

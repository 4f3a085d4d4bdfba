#pragma once
#include <array>
#include <iostream>
#include <string>
#include "calendar.hpp"
#include "store.hpp"

/* Lifetime statistics, persisted under their own keys in the store. Only the
   Streak_tracker changes them. */
class Stats {
public:
    static const int max_tries = 6;
    typedef std::array<int, max_tries> Distribution;

    Stats();

    int total_played;
    int total_won;
    Distribution win_distribution; // [i] is wins in i+1 tries
    int current_streak;
    int best_streak;
    int fewest_tries; // max_tries until there is a better record

    // whole percent, 0 before anything was played
    int win_percentage() const;

    std::string to_string() const;

    // Missing or unreadable keys keep their defaults (with a warning), a
    // corrupt store never stops the game.
    static Stats load(const Store::Store_intf& store);
    void save(Store::Batch& b) const;

    // "0,1,0,3,0,0"
    static std::string distribution_to_string(const Distribution& d);
    // throws unless exactly max_tries non-negative integers
    static Distribution distribution_of_string(const std::string& s);

    static void test();
};

std::ostream& operator<<(std::ostream& os, const Stats& s);

/* Folds a finished session into the stats. Guarded by LastStatsUpdate, so a
   day is only ever counted once however many times it's reported. */
class Streak_tracker {
public:
    explicit Streak_tracker(Store::Store_intf& store_);

    // Returns false (and changes nothing) if today was already counted.
    // [tries_used] must be 1..max_tries when [won], throws otherwise.
    bool on_session_terminal(bool won, int tries_used, Calendar::Day today);

    static void test();
private:
    Store::Store_intf& store;
};

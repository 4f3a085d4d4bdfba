/* The game as the front end sees it. Owns today's Session, wired to a store,
   a clock and a random source.

   Every entry point first checks the calendar day, and if it changed since the
   session was loaded rolls over to the new day's puzzle before doing anything
   else. Progress is written to the store after each accepted command, so the
   game can be resumed after a restart on the same day.
*/

#pragma once
#include <memory>
#include <stdexcept>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "calendar.hpp"
#include "daily_gate.hpp"
#include "generator.hpp"
#include "session.hpp"
#include "stats.hpp"
#include "store.hpp"

class Engine {
public:
    struct Snapshot {
        Session::Guesses guesses;
        int row;
        int column;
        bool terminal;
        Session::State state;
        Feedback::KeyFeedback key_feedback;
    };

    Engine(Store::Store_intf& store_, const Calendar::Clock& clock_, Generator::Random_source& rng_);

    // Loads today's puzzle, resuming saved progress if there is any.
    // Status::already_played_today if today's puzzle is finished (the finished
    // board is still loaded), Status::accepted otherwise.
    Status start();
    bool can_play_today();

    Status insert_character(char c);
    Status delete_character();
    Status submit_guess();

    Snapshot current_state();
    Stats stats() const;
    boost::posix_time::time_duration time_until_next_puzzle() const;
    // only meant to be shown once the game is over
    const Equation& get_answer();
    Calendar::Day get_day();

    // false if the last store write failed, the game carries on in memory
    bool persisted() const;

    static bool silence;

    static void test();
private:
    // rolls over if the day changed
    void refresh();
    void load(Calendar::Day today);
    void resume();
    Status check_playable();
    void save_progress();
    void on_terminal();
    void write_failed(const char* what, const std::exception& e);

    Store::Store_intf& store;
    const Calendar::Clock& clock;
    Generator::Random_source& rng;
    Daily_gate gate;
    Streak_tracker tracker;

    std::unique_ptr<Session> session;
    Calendar::Day day;
    bool last_write_ok;
};

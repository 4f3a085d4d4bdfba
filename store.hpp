#pragma once
#include <map>
#include <string>
#include <vector>
#include "calendar.hpp"

/* The string-keyed store that game progress and stats survive restarts in.
   The engine only sees Store_intf. Writes go through a Batch so a group of
   related keys (all the stats, say) is never visible half-written.
*/
namespace Store {
    // not set internally, the cli sets it for --quiet and the tests set it.
    extern bool silence;

    // Sets a silence flag for its lifetime and puts the old value back after,
    // also when a test throws.
    class Silencer {
    public:
        explicit Silencer(bool& flag_) : flag(flag_), old(flag_) { flag = true; }
        ~Silencer() { flag = old; }
        Silencer(const Silencer&) = delete;
        Silencer& operator=(const Silencer&) = delete;
    private:
        bool& flag;
        bool old;
    };

    namespace Keys {
        const char* const daily_equation      = "DailyEquation";
        const char* const last_equation_date  = "LastEquationDate";
        const char* const last_completed_date = "LastGameCompletedDate";
        const char* const last_stats_update   = "LastStatsUpdate";
        const char* const last_win_date       = "LastWinDate";
        const char* const last_played_date    = "LastPlayedDate";
        const char* const current_streak      = "CurrentStreak";
        const char* const best_streak         = "BestStreak";
        const char* const total_played        = "TotalGamesPlayed";
        const char* const total_won           = "TotalGamesWon";
        const char* const win_distribution    = "WinDistribution";
        const char* const fewest_tries        = "FewestTries";
        const char* const saved_guesses       = "SavedGuesses";
        const char* const guess_index         = "CurrentGuessIndex";
        const char* const char_index          = "CurrentCharIndex";
        const char* const key_colors          = "KeyColors";
    }

    class Batch {
    public:
        struct Change {
            std::string key;
            std::string value;
            bool erase;
        };

        // keys can't be empty or contain '=', neither keys nor values can contain
        // a newline. Throws otherwise.
        void set(const std::string& key, const std::string& value);
        void set(const std::string& key, int value);
        void set(const std::string& key, Calendar::Day value);
        void remove(const std::string& key);

        bool empty() const;
        const std::vector<Change>& get_changes() const;
    private:
        std::vector<Change> changes;
    };

    class Store_intf {
    public:
        virtual ~Store_intf() {};
        // returns true if we found [key]. If we return false [value] was not touched.
        virtual bool get(const std::string& key, std::string& value) const = 0;
        // either every change in [b] is applied or none is (and we throw)
        virtual void apply(const Batch& b) = 0;

        // other overloads
        void set(const std::string& key, const std::string& value);
        void remove(const std::string& key);
        bool has(const std::string& key) const;
        // false if missing or unreadable (with a warning), [value] is then untouched
        bool get_int(const std::string& key, int& value) const;
        bool get_day(const std::string& key, Calendar::Day& value) const;
    };

    class Memory_store : public Store_intf {
    public:
        virtual bool get(const std::string& key, std::string& value) const;
        virtual void apply(const Batch& b);
        size_t size() const;
    private:
        std::map<std::string, std::string> data;
    };

    // One "key=value" line per entry. Every apply rewrites the whole file to a
    // temporary and renames it into place.
    class File_store : public Store_intf {
    public:
        explicit File_store(const std::string& filename_);

        virtual bool get(const std::string& key, std::string& value) const;
        virtual void apply(const Batch& b);
        size_t size() const;
    private:
        void load_from_file();
        void write_file(const std::map<std::string, std::string>& contents) const;

        std::string filename;
        std::map<std::string, std::string> data;
    };

    // applies [b] to [data], shared by the implementations
    void apply_changes(const Batch& b, std::map<std::string, std::string>& data);

    void test();
}

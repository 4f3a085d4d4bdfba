#include <sstream>
#include <stdexcept>
#include "calendar.hpp"

using std::string;
using boost::posix_time::ptime;
using boost::posix_time::time_duration;
using boost::posix_time::microsec_clock;

namespace Calendar {
    ptime Local_clock::now() const {
        return microsec_clock::local_time();
    }

    Fixed_clock::Fixed_clock(ptime t_) : t(t_) {}
    ptime Fixed_clock::now() const { return t; }
    void Fixed_clock::set(ptime t_) { t = t_; }
    void Fixed_clock::advance(time_duration d) { t += d; }

    Day day_key(ptime local) {
        if (local.is_special()) {
            throw std::runtime_error("day_key of a special time: " + boost::posix_time::to_simple_string(local));
        }
        return local.date();
    }

    Day today(const Clock& clock) {
        return day_key(clock.now());
    }

    long days_between(Day from, Day to) {
        return (to - from).days();
    }

    time_duration time_until_next_day(ptime local) {
        ptime midnight(day_key(local) + boost::gregorian::days(1));
        return midnight - local;
    }

    string to_string(Day d) {
        return boost::gregorian::to_iso_extended_string(d);
    }

    Day day_of_string(const string& s) {
        // from_simple_string is lenient about separators, insist on YYYY-MM-DD
        if (s.length() != 10 || s[4] != '-' || s[7] != '-') {
            throw std::runtime_error("Expected YYYY-MM-DD, not: '" + s + "'");
        }
        try {
            return boost::gregorian::from_simple_string(s);
        } catch (const std::exception& e) {
            throw std::runtime_error("Bad date '" + s + "': " + e.what());
        }
    }

    void test() {
        using boost::posix_time::seconds;
        using boost::posix_time::time_from_string;

        std::stringstream output;
        std::stringstream expected;

        ptime late = time_from_string("2024-02-28 23:59:59");
        Fixed_clock clock(late);
        output << to_string(today(clock)) << " "
               << time_until_next_day(late) << std::endl;

        // one second later is a new day, and a leap day
        clock.advance(seconds(1));
        output << to_string(today(clock)) << " "
               << days_between(day_key(late), today(clock)) << " "
               << time_until_next_day(clock.now()) << std::endl;

        clock.set(time_from_string("2024-03-01 12:30:00"));
        output << days_between(today(clock), day_key(late)) << " "
               << days_between(day_key(late), today(clock)) << " "
               << time_until_next_day(clock.now()) << std::endl;

        output << to_string(day_of_string("2023-12-31")) << " "
               << days_between(day_of_string("2023-12-31"), day_of_string("2024-01-01"))
               << std::endl;

        expected << "2024-02-28 00:00:01" << std::endl;
        expected << "2024-02-29 1 24:00:00" << std::endl;
        expected << "-2 2 11:30:00" << std::endl;
        expected << "2023-12-31 1" << std::endl;

        string output_str = output.str();
        string expected_str = expected.str();
        if (output_str != expected_str) {
            throw std::runtime_error("Calendar::test() 1 failed, got\n" + output_str + ", but expected\n" + expected_str);
        }

        int rejected = 0;
        const char* bad[] = { "", "2024-13-01", "2023-02-29", "20240101", "2024/01/01", "yesterday!" };
        for (const char* s : bad) {
            try {
                day_of_string(s);
            } catch (const std::runtime_error&) {
                rejected++;
            }
        }
        try {
            day_key(ptime(boost::posix_time::not_a_date_time));
        } catch (const std::runtime_error&) {
            rejected++;
        }
        if (rejected != 7) {
            throw std::runtime_error("Calendar::test() 2 failed, only rejected " + std::to_string(rejected) + " of 7 bad inputs");
        }
    }
}

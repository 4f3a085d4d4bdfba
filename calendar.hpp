/* Everything that decides "is this the same day" goes through day_key(). Days are
   boost gregorian dates in the local time zone, persisted as YYYY-MM-DD.
*/

#pragma once
#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace Calendar {
    typedef boost::gregorian::date Day;

    class Clock {
    public:
        virtual ~Clock() {};
        // local wall-clock time
        virtual boost::posix_time::ptime now() const = 0;
    };

    class Local_clock : public Clock {
    public:
        virtual boost::posix_time::ptime now() const;
    };

    // stays where you put it, for tests and for replaying a given date
    class Fixed_clock : public Clock {
    public:
        explicit Fixed_clock(boost::posix_time::ptime t_);
        virtual boost::posix_time::ptime now() const;
        void set(boost::posix_time::ptime t_);
        void advance(boost::posix_time::time_duration d);
    private:
        boost::posix_time::ptime t;
    };

    Day day_key(boost::posix_time::ptime local);
    Day today(const Clock& clock);

    // positive when [to] is after [from]
    long days_between(Day from, Day to);

    // until the next local midnight, when the next puzzle unlocks
    boost::posix_time::time_duration time_until_next_day(boost::posix_time::ptime local);

    std::string to_string(Day d);
    // throws on anything that isn't a valid YYYY-MM-DD
    Day day_of_string(const std::string& s);

    void test();
}

#pragma once
#include "calendar.hpp"
#include "equation.hpp"
#include "store.hpp"

/* One puzzle per calendar day. Keeps the day's answer cached in the store
   and remembers whether today's puzzle is already finished. */
class Daily_gate {
public:
    explicit Daily_gate(Store::Store_intf& store_);

    // false iff today's puzzle was already completed
    bool can_play_today(Calendar::Day today) const;

    // true if the store holds an answer generated [today] that is still a valid
    // equation. [answer] is untouched otherwise.
    bool cached_answer(Calendar::Day today, Equation& answer) const;

    // Starts [today] with [answer]. In one batch: caches it, clears saved
    // session progress and any completion marker from an earlier day. Stats are
    // untouched. Throws if the store can't be written.
    void roll_over(Calendar::Day today, const Equation& answer);

    void mark_completed(Calendar::Day today);

    static void test();
private:
    Store::Store_intf& store;
};

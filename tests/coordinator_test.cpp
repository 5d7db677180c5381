/*
Purpose: Tests for the single-flight detection gate.

What this tests: only one round can be open at a time, a losing initiation has
no side effects, only the round's own initiator can close it, and when many
threads race to start a round at the same instant exactly one of them wins.
*/

#include "coordinator.hpp"

#include <atomic>
#include <cassert>
#include <thread>
#include <vector>

int main()
{
    // Sequential semantics.
    {
        cmhsim::DetectionCoordinator c;
        assert(!c.is_running());
        assert(c.current_initiator() == cmhsim::NoActor);

        assert(c.try_begin_round(3));
        assert(c.is_running());
        assert(c.current_initiator() == 3);

        assert(!c.try_begin_round(4));
        assert(!c.try_begin_round(3));
        assert(c.current_initiator() == 3);
        assert(c.rounds_started() == 1);

        // Someone else cannot close it.
        assert(!c.end_round(4));
        assert(c.is_running());

        assert(c.end_round(3));
        assert(!c.is_running());
        assert(c.current_initiator() == cmhsim::NoActor);
        assert(c.rounds_closed() == 1);

        // Closing twice is refused.
        assert(!c.end_round(3));

        assert(c.try_begin_round(4));
        assert(c.rounds_started() == 2);
    }

    // Simultaneous initiation: exactly one winner per round.
    for (int trial = 0; trial < 50; ++trial)
    {
        cmhsim::DetectionCoordinator c;
        constexpr int kContenders = 8;
        std::atomic<int> ready{0};
        std::atomic<bool> go{false};
        std::atomic<int> winners{0};
        std::atomic<cmhsim::ActorId> winner{cmhsim::NoActor};

        std::vector<std::thread> threads;
        for (int t = 0; t < kContenders; ++t)
        {
            threads.emplace_back([&, t]
                                 {
                                     const cmhsim::ActorId me = static_cast<cmhsim::ActorId>(t + 1);
                                     ++ready;
                                     while (!go.load())
                                     {
                                         std::this_thread::yield();
                                     }
                                     if (c.try_begin_round(me))
                                     {
                                         ++winners;
                                         winner = me;
                                     } });
        }
        while (ready.load() != kContenders)
        {
            std::this_thread::yield();
        }
        go = true;
        for (auto &t : threads)
        {
            t.join();
        }

        assert(winners.load() == 1);
        assert(c.current_initiator() == winner.load());
        assert(c.rounds_started() == 1);
    }

    return 0;
}

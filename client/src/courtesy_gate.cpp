#include "coursesync/client/courtesy_gate.hpp"

#include <algorithm>
#include <thread>
#include <utility>

namespace coursesync::client
{

    CourtesyGate::Sleeper CourtesyGate::default_sleeper()
    {
        return [](Clock::duration duration)
        { std::this_thread::sleep_for(duration); };
    }

    CourtesyGate::CourtesyGate(Sleeper sleeper) : sleeper_(std::move(sleeper)) {}

    void CourtesyGate::defer(std::chrono::milliseconds delay)
    {
        if (delay.count() <= 0)
        {
            return;
        }
        std::lock_guard lock(mutex_);
        not_before_ = std::max(not_before_, Clock::now() + delay);
        interval_ = delay;
        total_deferred_ += delay;
    }

    void CourtesyGate::wait()
    {
        Clock::time_point slot{};
        Clock::duration remaining{};
        {
            std::lock_guard lock(mutex_);
            const auto now = Clock::now();
            if (sleeping_ > 0)
            {
                // Queue behind the last waiter that is still sleeping.
                slot = std::max(last_slot_ + interval_, not_before_);
            }
            else if (not_before_ > now)
            {
                slot = not_before_;
            }
            else
            {
                return;
            }
            last_slot_ = slot;
            remaining = slot - now;
            ++sleeping_;
        }

        if (remaining > Clock::duration::zero())
        {
            try
            {
                sleeper_(remaining);
            }
            catch (...)
            {
                std::lock_guard lock(mutex_);
                --sleeping_;
                throw;
            }
        }

        std::lock_guard lock(mutex_);
        --sleeping_;
        // Once the queue drains the pending deferral is spent, unless a new one
        // was made while sleeping.
        if (sleeping_ == 0 && not_before_ <= last_slot_)
        {
            not_before_ = Clock::time_point{};
        }
    }

    std::chrono::milliseconds CourtesyGate::total_deferred() const
    {
        std::lock_guard lock(mutex_);
        return total_deferred_;
    }

} // namespace coursesync::client

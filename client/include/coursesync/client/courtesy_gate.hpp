#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>

namespace coursesync::client
{

    /**
     * Request pacing shared by every worker talking to the same account.
     *
     * defer() is called after a successful download; the next wait() by any
     * worker blocks until the delay has elapsed. Workers that queue up behind
     * a sleeping waiter are released one per delay interval, never together.
     */
    class CourtesyGate
    {
    public:
        using Clock = std::chrono::steady_clock;
        using Sleeper = std::function<void(Clock::duration)>;

        static Sleeper default_sleeper();

        explicit CourtesyGate(Sleeper sleeper = default_sleeper());

        void defer(std::chrono::milliseconds delay);

        void wait();

        std::chrono::milliseconds total_deferred() const;

    private:
        Sleeper sleeper_;
        mutable std::mutex mutex_;
        Clock::time_point not_before_{};
        Clock::time_point last_slot_{};
        Clock::duration interval_{};
        std::size_t sleeping_ = 0;
        std::chrono::milliseconds total_deferred_{0};
    };

} // namespace coursesync::client

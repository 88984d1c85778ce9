#pragma once

#include <chrono>
#include <stop_token>

class Timer {
public:
    using Clock = std::chrono::steady_clock;

    virtual ~Timer() = default;

    virtual Clock::time_point now() const = 0;

    // Block for `duration` or until `stop` is requested.
    // Returns false if the wait was cut short by a stop request.
    virtual bool wait_for(Clock::duration duration, std::stop_token stop) = 0;
};

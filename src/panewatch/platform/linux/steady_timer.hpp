#pragma once

#include "platform/timer.hpp"

#include <condition_variable>
#include <mutex>

class SteadyTimer : public Timer {
public:
    Clock::time_point now() const override { return Clock::now(); }
    bool wait_for(Clock::duration duration, std::stop_token stop) override;

private:
    std::mutex mutex_;
    std::condition_variable_any cv_;
};

#include "platform/linux/steady_timer.hpp"

bool SteadyTimer::wait_for(Clock::duration duration, std::stop_token stop) {
    if (stop.stop_requested()) return false;

    // Nothing notifies cv_; the stop token's callback is the only early wakeup.
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, stop, duration, [] { return false; });
    return !stop.stop_requested();
}

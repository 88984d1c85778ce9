#include "monitor_session.hpp"

#include "frame.hpp"

MonitorSession::MonitorSession(std::string target, Clock::time_point start,
                               Clock::duration timeout)
    : target_(std::move(target)), start_(start), deadline_(start + timeout) {}

MonitorSession::Clock::duration MonitorSession::elapsed(Clock::time_point now) const {
    return now - start_;
}

MonitorSession::Clock::duration MonitorSession::remaining(Clock::time_point now) const {
    if (now >= deadline_) return Clock::duration::zero();
    return deadline_ - now;
}

void MonitorSession::observe_frame(std::string frame) {
    if (last_frame_ && *last_frame_ == frame) {
        no_change_streak_++;
    } else {
        no_change_streak_ = 0;
        last_frame_ = std::move(frame);
    }
}

void MonitorSession::assign_state(ActivityKind kind) {
    auto idx = static_cast<size_t>(kind);
    if (last_state_ != kind) {
        state_streaks_.fill(0);
    }
    state_streaks_[idx]++;
    last_state_ = kind;
}

int MonitorSession::state_streak(ActivityKind kind) const {
    return state_streaks_[static_cast<size_t>(kind)];
}

void MonitorSession::mark_answered(uint64_t fingerprint) {
    answered_.insert(fingerprint);
    injections_++;
}

bool MonitorSession::take_progress_slot(const std::string& text, Clock::duration elapsed,
                                        Clock::duration interval) {
    auto label = frame::letters_only(text);
    if (last_progress_ == label && elapsed - last_progress_at_ < interval) {
        return false;
    }
    last_progress_ = std::move(label);
    last_progress_at_ = elapsed;
    return true;
}

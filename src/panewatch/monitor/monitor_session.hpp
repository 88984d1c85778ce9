#pragma once

#include "classifier/activity_state.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>

// Run-scoped state of one monitor invocation. Owned by the loop driving it and
// discarded when the loop ends.
class MonitorSession {
public:
    using Clock = std::chrono::steady_clock;

    MonitorSession(std::string target, Clock::time_point start, Clock::duration timeout);

    const std::string& target() const { return target_; }

    Clock::duration elapsed(Clock::time_point now) const;
    Clock::duration remaining(Clock::time_point now) const;
    bool deadline_passed(Clock::time_point now) const { return now >= deadline_; }

    // Record a captured frame. Extends the no-change streak if it is
    // byte-identical to the previous frame, resets it otherwise.
    void observe_frame(std::string frame);
    const std::optional<std::string>& last_frame() const { return last_frame_; }
    int no_change_streak() const { return no_change_streak_; }

    // Exactly one call per tick.
    void assign_state(ActivityKind kind);
    int state_streak(ActivityKind kind) const;
    std::optional<ActivityKind> last_state() const { return last_state_; }

    // Returns the new consecutive failure count.
    int capture_failed() { return ++capture_failures_; }
    void capture_succeeded() { capture_failures_ = 0; }
    int capture_failures() const { return capture_failures_; }

    bool answered(uint64_t fingerprint) const { return answered_.contains(fingerprint); }
    void mark_answered(uint64_t fingerprint);
    int injections() const { return injections_; }

    // Progress lines are logged when their wording changes (digits and glyphs
    // ignored) or `interval` has passed since the last one. Returns true if
    // this one should be logged.
    bool take_progress_slot(const std::string& text, Clock::duration elapsed,
                            Clock::duration interval);

private:
    std::string target_;
    Clock::time_point start_;
    Clock::time_point deadline_;

    std::optional<std::string> last_frame_;
    int no_change_streak_ = 0;

    std::optional<ActivityKind> last_state_;
    std::array<int, kActivityKindCount> state_streaks_{};

    int capture_failures_ = 0;

    std::unordered_set<uint64_t> answered_;
    int injections_ = 0;

    std::optional<std::string> last_progress_; // label of the last logged progress line
    Clock::duration last_progress_at_{};
};

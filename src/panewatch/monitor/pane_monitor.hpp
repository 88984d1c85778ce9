#pragma once

#include "classifier/activity_classifier.hpp"
#include "config.hpp"
#include "monitor/auto_responder.hpp"
#include "monitor/event_log.hpp"
#include "monitor/monitor_result.hpp"
#include "monitor/monitor_session.hpp"
#include "platform/multiplexer.hpp"
#include "platform/timer.hpp"

#include <chrono>
#include <stop_token>
#include <string>

// Blind polling monitor for one pane. Each tick captures the pane, classifies
// the frame, answers permission prompts, and decides whether to keep going.
// The loop ends when the pane stays unchanged for `stability_ticks` ticks,
// the timeout passes, captures fail `max_capture_failures` times in a row, or
// `stop` is requested. A final capture is returned on every path.
//
// Running two monitors on the same pane at once is the caller's problem; the
// panewatch frontend prevents it with a TargetLock.
class PaneMonitor {
public:
    PaneMonitor(Multiplexer& mux, Timer& timer, Config::Monitor settings,
                ActivityClassifier classifier, bool verbose = false);

    PaneMonitor(const PaneMonitor&) = delete;
    PaneMonitor& operator=(const PaneMonitor&) = delete;

    MonitorResult run(const std::string& target, std::chrono::milliseconds timeout,
                      std::stop_token stop = {});

private:
    // One capture/classify/respond round. Sets `busy` when the next tick
    // should come sooner (output moving, or keys just sent).
    MonitorStatus tick(MonitorSession& session, EventLog& events, bool& busy);

    // Fresh capture, or the last good frame if that fails.
    std::string final_capture(const MonitorSession& session);

    std::chrono::milliseconds elapsed_ms(const MonitorSession& session) const;

    void log(const std::string& msg);

    Multiplexer& mux_;
    Timer& timer_;
    Config::Monitor settings_;
    ActivityClassifier classifier_;
    AutoResponder responder_;
    bool verbose_;
};

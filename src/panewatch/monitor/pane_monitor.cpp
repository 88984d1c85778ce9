#include "pane_monitor.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <print>
#include <variant>

PaneMonitor::PaneMonitor(Multiplexer& mux, Timer& timer, Config::Monitor settings,
                         ActivityClassifier classifier, bool verbose)
    : mux_(mux), timer_(timer), settings_(settings),
      classifier_(std::move(classifier)), responder_(mux_), verbose_(verbose) {}

MonitorResult PaneMonitor::run(const std::string& target, std::chrono::milliseconds timeout,
                               std::stop_token stop) {
    MonitorSession session(target, timer_.now(), timeout);
    EventLog events;
    events.set_echo(verbose_);

    log(std::format("Monitoring {} (timeout {:.1f}s, prompt window {} lines)", target,
                    std::chrono::duration<double>(timeout).count(),
                    classifier_.window_lines()));

    auto status = MonitorStatus::Running;
    try {
        while (status == MonitorStatus::Running) {
            if (stop.stop_requested()) {
                status = MonitorStatus::Cancelled;
                break;
            }
            if (session.deadline_passed(timer_.now())) {
                status = MonitorStatus::TimedOut;
                break;
            }

            bool busy = false;
            status = tick(session, events, busy);
            if (status != MonitorStatus::Running) break;

            // Never sleep past the deadline, so the overrun is at most one interval.
            Timer::Clock::duration interval =
                busy ? settings_.busy_interval() : settings_.poll_interval();
            auto wait = std::min(interval, session.remaining(timer_.now()));
            if (!timer_.wait_for(wait, stop)) {
                status = MonitorStatus::Cancelled;
            }
        }
    } catch (const std::exception& e) {
        std::println(stderr, "monitor: {} aborted: {}", target, e.what());
        status = MonitorStatus::Failed;
    }

    MonitorResult result;
    result.status = status;
    result.target = target;
    result.elapsed = elapsed_ms(session);
    result.final_text = final_capture(session);
    result.injections = session.injections();
    result.events = events.take();

    log(std::format("{} after {:.1f}s, {} events, {} responses sent", to_string(status),
                    std::chrono::duration<double>(result.elapsed).count(),
                    result.events.size(), result.injections));
    return result;
}

MonitorStatus PaneMonitor::tick(MonitorSession& session, EventLog& events, bool& busy) {
    auto elapsed = elapsed_ms(session);

    auto captured = mux_.capture(session.target());
    if (!captured) {
        int failures = session.capture_failed();
        session.assign_state(ActivityKind::Unknown);
        events.add(elapsed, EventKind::CaptureError,
                   std::format("{} ({}/{})", captured.error(), failures,
                               settings_.max_capture_failures));
        if (failures >= static_cast<int>(settings_.max_capture_failures)) {
            return MonitorStatus::Failed;
        }
        return MonitorStatus::Running;
    }
    session.capture_succeeded();

    auto state = classifier_.classify(session.last_frame(), *captured);
    session.observe_frame(std::move(*captured));
    session.assign_state(kind_of(state));
    if (session.state_streak(kind_of(state)) == 1) {
        log(std::format("state: {}", to_string(kind_of(state))));
    }

    if (auto* prompt = std::get_if<AwaitingPermission>(&state)) {
        auto res = responder_.respond(session, *prompt);
        std::string detail;
        if (!res) {
            detail = std::format("\"{}\" send failed: {}", prompt->prompt, res.error());
        } else if (*res) {
            detail = std::format("\"{}\" -> sent \"{}\"", prompt->prompt, prompt->response);
            busy = true;
        } else {
            detail = std::format("\"{}\" already answered", prompt->prompt);
        }
        events.add(elapsed, EventKind::PermissionRequest, std::move(detail));
        return MonitorStatus::Running;
    }

    if (std::holds_alternative<Idle>(state)) {
        if (session.no_change_streak() >= static_cast<int>(settings_.stability_ticks)) {
            events.add(elapsed, EventKind::IdleDetected,
                       std::format("no change for {} ticks", session.no_change_streak()));
            return MonitorStatus::Succeeded;
        }
        return MonitorStatus::Running;
    }

    // Processing or Unknown: the pane is still moving.
    busy = true;
    std::string progress = "(output changing)";
    if (auto* p = std::get_if<Processing>(&state)) {
        progress = p->progress;
    }
    if (session.take_progress_slot(progress, elapsed,
                                   std::chrono::seconds(settings_.status_log_interval_s))) {
        events.add(elapsed, EventKind::Progress, std::move(progress));
    }
    return MonitorStatus::Running;
}

std::string PaneMonitor::final_capture(const MonitorSession& session) {
    auto captured = mux_.capture(session.target());
    if (captured) return std::move(*captured);

    log("Final capture failed: " + captured.error());
    return session.last_frame().value_or(std::string{});
}

std::chrono::milliseconds PaneMonitor::elapsed_ms(const MonitorSession& session) const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(session.elapsed(timer_.now()));
}

void PaneMonitor::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[panewatch] {}", msg);
    }
}

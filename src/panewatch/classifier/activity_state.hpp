#pragma once

#include <string>
#include <variant>

struct Processing {
    std::string progress; // e.g. "✻ Thinking… (12s · 1.2k tokens)", logging only

    bool operator==(const Processing&) const = default;
};

struct AwaitingPermission {
    std::string prompt;   // the question line shown to the user
    std::string context;  // prompt block used for fingerprinting (question, options, lines above)
    std::string response; // token to type, e.g. "1" or "y"
    bool submit = false;  // follow the token with Enter

    bool operator==(const AwaitingPermission&) const = default;
};

struct Idle {
    bool operator==(const Idle&) const = default;
};

struct Unknown {
    bool operator==(const Unknown&) const = default;
};

using ActivityState = std::variant<Processing, AwaitingPermission, Idle, Unknown>;

// Same order as the ActivityState alternatives.
enum class ActivityKind { Processing, AwaitingPermission, Idle, Unknown };

inline constexpr size_t kActivityKindCount = std::variant_size_v<ActivityState>;

inline ActivityKind kind_of(const ActivityState& state) {
    return static_cast<ActivityKind>(state.index());
}

inline const char* to_string(ActivityKind kind) {
    switch (kind) {
        case ActivityKind::Processing: return "processing";
        case ActivityKind::AwaitingPermission: return "awaiting-permission";
        case ActivityKind::Idle: return "idle";
        case ActivityKind::Unknown: return "unknown";
    }
    return "unknown";
}

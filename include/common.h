#pragma once

#include <cstdint>
#include <string>
#include <chrono>
#include <functional>

namespace cabin_voice {

// Timing
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

/// Clock source; injectable so TTL and session timing can be tested deterministically
using ClockFn = std::function<TimePoint()>;

inline int64_t ms_since(TimePoint start) {
    auto now = Clock::now();
    return std::chrono::duration_cast<Duration>(now - start).count();
}

inline int64_t ms_between(TimePoint start, TimePoint end) {
    return std::chrono::duration_cast<Duration>(end - start).count();
}

/// Wall-clock milliseconds since epoch (for timestamps written to context and logs)
inline int64_t wall_ms() {
    return std::chrono::duration_cast<Duration>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Component names used by health checks, recovery and telemetry
namespace component {
    constexpr const char* SPEECH_INPUT = "speech_recognition";
    constexpr const char* UNDERSTANDING = "nlu";
    constexpr const char* DIALOGUE = "dialogue_manager";
    constexpr const char* SPEECH_OUTPUT = "tts";
    constexpr const char* VEHICLE = "vehicle_integration";
    constexpr const char* CONTEXT = "context_fusion";
    constexpr const char* TELEMETRY = "telemetry";
}

// UI states pushed to the vehicle head unit
namespace ui_state {
    constexpr const char* IDLE = "idle";
    constexpr const char* LISTENING = "listening";
    constexpr const char* PROCESSING = "processing";
    constexpr const char* SPEAKING = "speaking";
}

} // namespace cabin_voice

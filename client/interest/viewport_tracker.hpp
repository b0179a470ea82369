#pragma once

#include "chunk_mapper.hpp"

#include <chrono>
#include <optional>

namespace client::interest {

struct TrackerSettings {
    // Visible extent around the focal point, in world units.
    float viewWidth{1280.0f};
    float viewHeight{720.0f};

    // Pre-fetch margin added on every side of the visible rectangle.
    float bufferMargin{96.0f};

    // A new viewport is pushed at most once per debounce interval, and only after the
    // focal point has moved more than sqrt(moveThresholdSq) from the last pushed point.
    std::chrono::milliseconds debounce{250};
    float moveThresholdSq{48.0f * 48.0f};
};

// Turns a stream of focal-point positions (the local actor) into infrequent, wholesale
// viewport replacements.
class ViewportTracker {
public:
    using Clock = std::chrono::steady_clock;

    explicit ViewportTracker(TrackerSettings settings = {});

    // Returns the new viewport when one should be pushed, nullopt otherwise.
    std::optional<Viewport> update(float focusX, float focusY, Clock::time_point now);

    // Forget the focal point; the next update() pushes immediately.
    void reset();

    const std::optional<Viewport>& current() const { return current_; }
    const TrackerSettings& settings() const { return settings_; }

    Viewport viewport_around(float focusX, float focusY) const;

private:
    TrackerSettings settings_;

    std::optional<Viewport> current_;
    float lastX_{0.0f};
    float lastY_{0.0f};
    Clock::time_point lastPush_{};
};

} // namespace client::interest

#include "viewport_tracker.hpp"

namespace client::interest {

ViewportTracker::ViewportTracker(TrackerSettings settings)
    : settings_(settings) {}

Viewport ViewportTracker::viewport_around(float focusX, float focusY) const {
    const float halfW = settings_.viewWidth * 0.5f;
    const float halfH = settings_.viewHeight * 0.5f;

    Viewport vp{focusX - halfW, focusY - halfH, focusX + halfW, focusY + halfH};
    return vp.expanded(settings_.bufferMargin);
}

std::optional<Viewport> ViewportTracker::update(float focusX, float focusY, Clock::time_point now) {
    if (current_) {
        if (now - lastPush_ < settings_.debounce) {
            return std::nullopt;
        }

        const float dx = focusX - lastX_;
        const float dy = focusY - lastY_;
        if (dx * dx + dy * dy <= settings_.moveThresholdSq) {
            return std::nullopt;
        }
    }

    current_ = viewport_around(focusX, focusY);
    lastX_ = focusX;
    lastY_ = focusY;
    lastPush_ = now;
    return current_;
}

void ViewportTracker::reset() {
    current_.reset();
    lastX_ = 0.0f;
    lastY_ = 0.0f;
    lastPush_ = Clock::time_point{};
}

} // namespace client::interest

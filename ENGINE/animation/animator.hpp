#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <utility>
#include <vector>

#include "animation/animatable.hpp"
#include "animation/timed_property.hpp"

namespace animation {

using Clock = std::chrono::steady_clock;

enum class AnimationState {
    Playing,
    Over
};

void validate_duration(Clock::duration duration);

// Drives a fixed set of properties over one wall-clock duration. A new
// animator starts out finished; reset() starts playback. State is derived
// from the clock on every call, so over-polling after the end keeps emitting
// the end values.
template <typename Key>
class Animator {
public:
    Animator(std::vector<TimedProperty<Key>> values,
             Clock::duration duration,
             Clock::time_point now = Clock::now())
    : values_(std::move(values)),
      duration_(duration),
      start_(now - duration) {
        validate_duration(duration_);
        for (std::size_t i = 0; i < values_.size(); ++i) {
            validate_property(values_[i].window, values_[i].curve, i);
        }
    }

    void reset(Clock::time_point now = Clock::now()) {
        start_ = now;
    }

    float progress(Clock::time_point now = Clock::now()) const {
        const float elapsed = std::chrono::duration<float>(now - start_).count();
        const float total = std::chrono::duration<float>(duration_).count();
        return std::min(elapsed / total, 1.0f);
    }

    // Later entries win when two entries share an id. The returned state
    // always agrees with is_playing(now).
    AnimationState animate(Animatable<Key>& target, Clock::time_point now = Clock::now()) const {
        const float timepoint = progress(now);
        for (const auto& value : values_) {
            target.set(value.id, value.evaluate(timepoint));
        }
        return is_playing(now) ? AnimationState::Playing : AnimationState::Over;
    }

    bool is_playing(Clock::time_point now = Clock::now()) const {
        return (now - start_) < duration_;
    }

    Animator reversed(Clock::time_point now = Clock::now()) const {
        std::vector<TimedProperty<Key>> values = values_;
        for (auto& value : values) {
            value.reverse();
        }
        return Animator(std::move(values), duration_, now);
    }

    const std::vector<TimedProperty<Key>>& values() const { return values_; }
    Clock::duration duration() const { return duration_; }

private:
    std::vector<TimedProperty<Key>> values_;
    Clock::duration   duration_;
    Clock::time_point start_;
};

}

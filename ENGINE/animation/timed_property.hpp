#pragma once

#include <algorithm>
#include <cstddef>
#include <utility>

#include "animation/curve.hpp"

namespace animation {

// Endpoints are ordered: a range with start > end animates backwards.
struct ValueRange {
    float start = 0.0f;
    float end   = 0.0f;

    float lerp(float a) const { return start * (1.0f - a) + end * a; }
};

// Sub-interval of the animator's progress, inside [0, 1].
struct TimeWindow {
    float start = 0.0f;
    float end   = 1.0f;

    float length() const { return end - start; }
};

// Throws std::invalid_argument when the window is not 0 <= start < end <= 1
// or the curve strength is not positive. `index` only feeds the message.
void validate_property(const TimeWindow& window, const Curve& curve, std::size_t index);

template <typename Key>
struct TimedProperty {
    Key        id{};
    ValueRange range{};
    Curve      curve{};
    TimeWindow window{};

    float evaluate(float progress) const {
        const float clamped = std::clamp(progress, window.start, window.end);
        const float local = (clamped - window.start) / window.length();
        return range.lerp(curve.apply(local));
    }

    void reverse() {
        curve = curve.reversed();
        std::swap(range.start, range.end);
        window = TimeWindow{ 1.0f - window.end, 1.0f - window.start };
    }
};

}

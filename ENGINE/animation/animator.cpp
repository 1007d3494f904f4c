#include "animation/animator.hpp"

#include <sstream>
#include <stdexcept>

namespace animation {

void validate_property(const TimeWindow& window, const Curve& curve, std::size_t index) {
    if (!(window.start >= 0.0f && window.end <= 1.0f && window.start < window.end)) {
        std::ostringstream oss;
        oss << "Animated property #" << index << " has time window ["
            << window.start << ", " << window.end
            << "]; expected 0 <= start < end <= 1";
        throw std::invalid_argument(oss.str());
    }
    if (!curve.has_valid_strength()) {
        std::ostringstream oss;
        oss << "Animated property #" << index << " uses " << curve.describe()
            << "; easing strength must be positive";
        throw std::invalid_argument(oss.str());
    }
}

void validate_duration(Clock::duration duration) {
    if (duration <= Clock::duration::zero()) {
        throw std::invalid_argument("Animator duration must be positive");
    }
}

}

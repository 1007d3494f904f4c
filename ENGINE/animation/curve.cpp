#include "animation/curve.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace animation {

Curve::Curve(Kind kind, float strength)
: kind_(kind), strength_(strength) {}

Curve Curve::linear() {
    return Curve(Kind::Linear, 1.0f);
}

Curve Curve::ease_in(float strength) {
    return Curve(Kind::EaseIn, strength);
}

Curve Curve::ease_out(float strength) {
    return Curve(Kind::EaseOut, strength);
}

float Curve::apply(float t) const {
    const float v = std::clamp(t, 0.0f, 1.0f);
    switch (kind_) {
    case Kind::EaseIn:
        return std::pow(v, strength_);
    case Kind::EaseOut:
        return 1.0f - std::pow(1.0f - v, strength_);
    case Kind::Linear:
    default:
        return v;
    }
}

Curve Curve::reversed() const {
    switch (kind_) {
    case Kind::EaseIn:  return Curve(Kind::EaseOut, strength_);
    case Kind::EaseOut: return Curve(Kind::EaseIn, strength_);
    case Kind::Linear:
    default:            return *this;
    }
}

bool Curve::has_valid_strength() const {
    if (kind_ == Kind::Linear) {
        return true;
    }
    return std::isfinite(strength_) && strength_ > 0.0f;
}

std::string Curve::describe() const {
    std::ostringstream oss;
    switch (kind_) {
    case Kind::EaseIn:  oss << "ease_in(" << strength_ << ")"; break;
    case Kind::EaseOut: oss << "ease_out(" << strength_ << ")"; break;
    case Kind::Linear:
    default:            oss << "linear"; break;
    }
    return oss.str();
}

bool Curve::operator==(const Curve& other) const {
    if (kind_ != other.kind_) {
        return false;
    }
    return kind_ == Kind::Linear || strength_ == other.strength_;
}

}

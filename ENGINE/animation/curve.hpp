#pragma once

#include <string>

namespace animation {

// Easing applied to normalized progress. Strength only matters for the eased
// variants and must be positive; Animator rejects anything else at
// construction.
class Curve {
public:
    enum class Kind {
        Linear = 0,
        EaseIn = 1,
        EaseOut = 2
    };

    Curve() = default;

    static Curve linear();
    static Curve ease_in(float strength);
    static Curve ease_out(float strength);

    // Clamps t to [0, 1] before easing.
    float apply(float t) const;

    // EaseIn(s) <-> EaseOut(s), Linear stays Linear. Not the exact functional
    // inverse of t^s; reversed animations rely on this swap as is.
    Curve reversed() const;

    bool has_valid_strength() const;

    std::string describe() const;

    bool operator==(const Curve& other) const;
    bool operator!=(const Curve& other) const { return !(*this == other); }

private:
    Curve(Kind kind, float strength);

    Kind  kind_ = Kind::Linear;
    float strength_ = 1.0f;
};

}

#pragma once

namespace animation {

// Anything an Animator can drive. Key is the target's own property namespace.
template <typename Key>
class Animatable {
public:
    virtual ~Animatable() = default;

    virtual void set(const Key& id, float value) = 0;
};

}

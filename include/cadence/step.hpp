#pragma once

#include <cadence/easing.hpp>
#include <cstdint>
#include <functional>
#include <variant>

namespace cadence
{

// Flags forwarded verbatim to the animation host (UIViewAnimationOptions subset).
// With no curve flag set the host uses ease-in-out.
enum class AnimationOptions : uint16_t
{
    None                  = 0,
    AllowUserInteraction  = 0x01,
    BeginFromCurrentState = 0x02,
    CurveEaseIn           = 0x10,
    CurveEaseOut          = 0x20,
    CurveLinear           = 0x40,
};

inline AnimationOptions operator|(AnimationOptions a, AnimationOptions b)
{
    return static_cast<AnimationOptions>(static_cast<uint16_t>(a) | static_cast<uint16_t>(b));
}
inline AnimationOptions operator&(AnimationOptions a, AnimationOptions b)
{
    return static_cast<AnimationOptions>(static_cast<uint16_t>(a) & static_cast<uint16_t>(b));
}
inline bool has_option(AnimationOptions set, AnimationOptions flag)
{
    return (static_cast<uint16_t>(set) & static_cast<uint16_t>(flag)) != 0;
}

// Resolve the timing curve encoded in an option set.
// Linear wins over ease-in/ease-out; ease-in plus ease-out means ease-in-out.
Timing timing_for(AnimationOptions options);

using Effect = std::function<void()>;

// Handed to a wait effect. Invoking it signals that the step is done;
// only the first signal for a step has any effect.
using ResumeFn   = std::function<void()>;
using WaitEffect = std::function<void(ResumeFn)>;

using DecisionFn = std::function<bool()>;

// Liveness check for the non-owning target an effect mutates.
// Empty means the step has no target and is always dispatched.
using TargetProbe = std::function<bool()>;

struct ActionStep
{
    Effect      effect;
    TargetProbe target;
};

struct AnimationStep
{
    float            duration = 0.0f;
    float            delay    = 0.0f;
    AnimationOptions options  = AnimationOptions::None;
    Effect           effect;
    TargetProbe      target;
};

struct WaitStep
{
    float       timeout = 0.0f;
    WaitEffect  effect;
    TargetProbe target;
};

struct DecisionStep
{
    DecisionFn evaluator;
};

using Step = std::variant<ActionStep, AnimationStep, WaitStep, DecisionStep>;

const char* step_kind_name(const Step& step);

// Throws std::invalid_argument describing the first violated constraint.
void validate_step(const Step& step);

}   // namespace cadence

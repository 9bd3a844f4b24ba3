#pragma once

#include <cadence/step.hpp>
#include <cstdint>
#include <functional>

namespace cadence
{

// Parameters of one animated transaction, forwarded untouched from the step.
struct AnimationRequest
{
    float            duration = 0.0f;
    float            delay    = 0.0f;
    AnimationOptions options  = AnimationOptions::None;
};

// Receives `finished == false` when the transaction was cut short.
using AnimationCompletion = std::function<void(bool finished)>;

// Runs effects inside animated transactions.
//
// Implementations must invoke `on_complete` exactly once per call. They may
// invoke it synchronously, but a chain never relies on that.
class AnimationHost
{
   public:
    virtual ~AnimationHost() = default;

    virtual void animate(const AnimationRequest& request,
                         Effect                  effect,
                         AnimationCompletion     on_complete) = 0;
};

// One-shot timers.
class TimerHost
{
   public:
    using TimerId = uint64_t;

    static constexpr TimerId INVALID_TIMER = 0;

    virtual ~TimerHost() = default;

    // Invoke `callback` once after `timeout` seconds unless cancelled first.
    virtual TimerId schedule(float timeout, std::function<void()> callback) = 0;

    // No-op for ids that already fired or were cancelled.
    virtual void cancel(TimerId id) = 0;
};

}   // namespace cadence

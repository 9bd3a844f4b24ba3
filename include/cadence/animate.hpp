#pragma once

#include <cadence/host.hpp>
#include <cadence/step.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace cadence
{

enum class ChainState
{
    Idle,          // Built, not started
    Running,       // A step is in flight or being dispatched
    Completed,     // Every step ran
    Interrupted,   // A decision returned false
};

const char* chain_state_name(ChainState state);

// Receives `interrupted == true` when a decision cut the chain short.
using ChainCompletion = std::function<void(bool interrupted)>;

// Animate: declarative chain of actions, animations, waits and decisions.
//
// Builder calls only append; nothing runs until run(). Steps then execute
// strictly one after another: step n+1 starts only once step n has signalled
// completion, so at most one step is in flight.
//
//   Animate()
//       .do_action([&] { badge.hidden = false; })
//       .animate(0.3f, [&] { badge.alpha = 1.0f; })
//       .wait(1.0f, [&](ResumeFn resume) { spinner.on_done(resume); })
//       .decide([&] { return !user_cancelled; })
//       .then(effects.corner(card, 0.25f, 12.0f))
//       .run(stage, stage, [](bool interrupted) { ... });
//
// Invalid parameters throw std::invalid_argument at append time and leave the
// chain untouched. Appending once the chain has started throws std::logic_error.
//
// Completed and Interrupted are terminal. Copying an Animate copies its steps
// into a fresh Idle chain, which is how a chain is replayed.
//
// Not thread-safe: build and run a chain from one thread (the event loop).
class Animate
{
   public:
    Animate();
    ~Animate();

    Animate(const Animate& other);
    Animate& operator=(const Animate& other);
    Animate(Animate&& other) noexcept;
    Animate& operator=(Animate&& other) noexcept;

    // ─── Composition ────────────────────────────────────────────────────

    // Synchronous side effect; the chain advances immediately after it.
    Animate& do_action(Effect effect, TargetProbe target = {});

    // Animated transaction. duration and delay must be >= 0; zero is legal.
    Animate& animate(float duration, Effect effect);
    Animate& animate(float duration, float delay, Effect effect);
    Animate& animate(float            duration,
                     float            delay,
                     AnimationOptions options,
                     Effect           effect,
                     TargetProbe      target = {});

    // Effect that reports completion itself through the ResumeFn it receives.
    // If it does not within timeout seconds (> 0) the chain moves on anyway.
    Animate& wait(float timeout, WaitEffect effect, TargetProbe target = {});

    // Evaluated when reached; false skips the remaining steps.
    Animate& decide(DecisionFn evaluator);

    // Appends copies of every step of `other`. `other` is left unchanged.
    Animate& then(const Animate& other);

    Animate& append(Step step);

    // ─── Execution ──────────────────────────────────────────────────────

    // Start executing. Returns false (and does nothing) unless the chain is Idle.
    // The hosts must outlive the run. `completion` fires exactly once.
    bool run(AnimationHost& animations, TimerHost& timers, ChainCompletion completion = {});

    bool perform(AnimationHost& animations, TimerHost& timers, ChainCompletion completion = {})
    {
        return run(animations, timers, std::move(completion));
    }

    // ─── Queries ────────────────────────────────────────────────────────

    ChainState state() const;
    bool       is_running() const { return state() == ChainState::Running; }

    // Index of the step in flight (or about to be dispatched). 0 before run();
    // equals size() once Completed and points at the decision when Interrupted.
    size_t cursor() const;

    size_t                   size() const { return steps_.size(); }
    bool                     empty() const { return steps_.empty(); }
    const std::vector<Step>& steps() const { return steps_; }

   private:
    struct Progress;
    class Execution;

    void ensure_mutable() const;

    std::vector<Step>         steps_;
    std::shared_ptr<Progress> progress_;
};

}   // namespace cadence

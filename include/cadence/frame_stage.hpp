#pragma once

#include <cadence/host.hpp>
#include <cstdint>
#include <functional>
#include <vector>

namespace cadence
{

// FrameStage: frame-driven animation host and timer facility.
//
// Headless stand-in for a platform animation system. Time only moves when
// update(dt) is called, which makes chains deterministic under test and lets
// a real-time loop (FrameClock) drive them in an application.
//
// Transactions: the effect runs immediately when delay is zero (the model
// value changes at once, as in UIKit) or on the update that crosses the delay.
// Completion fires on the update where delay + duration has elapsed, and never
// from inside animate().
//
// Callbacks run after the bookkeeping for a frame is done. Work they schedule
// (the next step of a chain) is first advanced by the following update().
//
// Not thread-safe: call from the event-loop thread.
class FrameStage : public AnimationHost, public TimerHost
{
   public:
    using TransactionId = uint64_t;

    struct TransactionInfo
    {
        TransactionId    id = 0;
        AnimationRequest request;
        float            elapsed = 0.0f;   // includes the delay
        bool             started = false;  // effect has run

        // Eased progress in [0,1] of the animated part, using the request's curve.
        float progress() const;
    };

    static constexpr float DEFAULT_MAX_FRAME_DT = 0.25f;

    explicit FrameStage(float max_frame_dt = DEFAULT_MAX_FRAME_DT);
    ~FrameStage() override = default;

    FrameStage(const FrameStage&)            = delete;
    FrameStage& operator=(const FrameStage&) = delete;

    // ─── AnimationHost ──────────────────────────────────────────────────
    void animate(const AnimationRequest& request,
                 Effect                  effect,
                 AnimationCompletion     on_complete) override;

    // ─── TimerHost ──────────────────────────────────────────────────────
    TimerId schedule(float timeout, std::function<void()> callback) override;
    void    cancel(TimerId id) override;

    // ─── Update ─────────────────────────────────────────────────────────

    // Advance time by dt seconds (clamped to max_frame_dt; negative is ignored).
    void update(float dt);

    // Step in fixed increments until nothing is pending or max_seconds pass.
    // Returns the simulated time consumed.
    float run_until_idle(float step = 1.0f / 60.0f, float max_seconds = 60.0f);

    // Stop every transaction (completing it with finished == false) and drop timers.
    void cancel_all();

    // ─── Queries ────────────────────────────────────────────────────────
    bool   has_pending_work() const;
    size_t active_transactions() const;
    size_t pending_timers() const;
    float  now() const { return now_; }

    std::vector<TransactionInfo> transactions() const;

    float max_frame_dt() const { return max_frame_dt_; }
    void  set_max_frame_dt(float dt);

   private:
    struct Transaction
    {
        TransactionId       id;
        AnimationRequest    request;
        Effect              effect;
        AnimationCompletion on_complete;
        float               elapsed  = 0.0f;
        bool                started  = false;
        bool                finished = false;
    };

    struct Timer
    {
        TimerId               id;
        float                 remaining;
        std::function<void()> callback;
        bool                  due      = false;   // fired this frame, callback not run yet
        bool                  finished = false;
    };

    float         max_frame_dt_;
    float         now_             = 0.0f;
    TransactionId next_transaction_ = 1;
    TimerId       next_timer_       = 1;

    std::vector<Transaction> transactions_;
    std::vector<Timer>       timers_;

    std::function<void()> take_due_timer(TimerId id);
    void                  gc();   // Remove finished records
};

}   // namespace cadence

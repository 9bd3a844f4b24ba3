#include <algorithm>
#include <cadence/frame_stage.hpp>
#include <cadence/logger.hpp>
#include <cmath>
#include <utility>

namespace cadence
{

float FrameStage::TransactionInfo::progress() const
{
    if (!started)
        return 0.0f;
    if (request.duration <= 0.0f)
        return 1.0f;

    float t = std::clamp((elapsed - request.delay) / request.duration, 0.0f, 1.0f);
    return easing_for(timing_for(request.options))(t);
}

FrameStage::FrameStage(float max_frame_dt) : max_frame_dt_(max_frame_dt > 0.0f ? max_frame_dt : DEFAULT_MAX_FRAME_DT)
{
}

void FrameStage::set_max_frame_dt(float dt)
{
    if (dt > 0.0f)
        max_frame_dt_ = dt;
}

// ─── AnimationHost ──────────────────────────────────────────────────────────

void FrameStage::animate(const AnimationRequest& request,
                         Effect                  effect,
                         AnimationCompletion     on_complete)
{
    Transaction tx;
    tx.id          = next_transaction_++;
    tx.request     = request;
    tx.effect      = std::move(effect);
    tx.on_complete = std::move(on_complete);

    CADENCE_LOG_TRACE("stage",
                      "transaction {} begins (duration={} delay={})",
                      tx.id,
                      request.duration,
                      request.delay);

    // Zero delay: apply the model change right away, animate the rest.
    Effect now_effect;
    if (request.delay <= 0.0f)
    {
        tx.started = true;
        now_effect = std::move(tx.effect);
    }

    transactions_.push_back(std::move(tx));

    if (now_effect)
        now_effect();
}

// ─── TimerHost ──────────────────────────────────────────────────────────────

TimerHost::TimerId FrameStage::schedule(float timeout, std::function<void()> callback)
{
    Timer timer;
    timer.id        = next_timer_++;
    timer.remaining = std::max(timeout, 0.0f);
    timer.callback  = std::move(callback);
    timers_.push_back(std::move(timer));
    return timers_.back().id;
}

void FrameStage::cancel(TimerId id)
{
    for (auto& t : timers_)
    {
        if (t.id == id && !t.finished)
        {
            t.finished = true;
            t.callback = nullptr;
        }
    }
}

// ─── Update ─────────────────────────────────────────────────────────────────

void FrameStage::update(float dt)
{
    if (!(dt >= 0.0f))
    {
        CADENCE_LOG_WARN("stage", "ignoring invalid frame dt {}", dt);
        return;
    }
    if (dt > max_frame_dt_)
        dt = max_frame_dt_;

    now_ += dt;

    // Due work is collected first and run afterwards, so callbacks that
    // schedule new transactions or timers never touch the vectors being walked.
    std::vector<std::function<void()>> due;

    const size_t tx_count = transactions_.size();
    for (size_t i = 0; i < tx_count; ++i)
    {
        auto& tx = transactions_[i];
        if (tx.finished)
            continue;

        tx.elapsed += dt;

        if (!tx.started && tx.elapsed >= tx.request.delay)
        {
            tx.started = true;
            if (tx.effect)
                due.push_back(std::move(tx.effect));
        }

        if (tx.started && tx.elapsed >= tx.request.delay + tx.request.duration)
        {
            tx.finished = true;
            if (tx.on_complete)
            {
                due.push_back([cb = std::move(tx.on_complete)]() { cb(true); });
            }
            CADENCE_LOG_TRACE("stage", "transaction {} finished", tx.id);
        }
    }

    // Timer callbacks stay in their records until dispatch, so a cancel() from
    // an earlier callback in this frame still reaches them.
    std::vector<TimerId> due_timers;

    const size_t timer_count = timers_.size();
    for (size_t i = 0; i < timer_count; ++i)
    {
        auto& t = timers_[i];
        if (t.finished)
            continue;

        if (!t.due)
        {
            t.remaining -= dt;
            if (t.remaining > 0.0f)
                continue;
            t.due = true;
        }
        due_timers.push_back(t.id);
        CADENCE_LOG_TRACE("stage", "timer {} fired", t.id);
    }

    gc();

    for (auto& fn : due)
    {
        fn();
    }

    for (TimerId id : due_timers)
    {
        std::function<void()> callback = take_due_timer(id);
        if (callback)
            callback();
    }

    gc();
}

std::function<void()> FrameStage::take_due_timer(TimerId id)
{
    for (auto& t : timers_)
    {
        if (t.id == id)
        {
            if (t.finished)
                return {};
            t.finished = true;
            return std::exchange(t.callback, nullptr);
        }
    }
    return {};
}

float FrameStage::run_until_idle(float step, float max_seconds)
{
    if (step <= 0.0f)
        step = 1.0f / 60.0f;

    float consumed = 0.0f;
    while (has_pending_work() && consumed < max_seconds)
    {
        update(step);
        consumed += step;
    }
    if (has_pending_work())
    {
        CADENCE_LOG_WARN("stage", "still busy after {} simulated seconds", consumed);
    }
    return consumed;
}

void FrameStage::cancel_all()
{
    std::vector<AnimationCompletion> stopped;
    for (auto& tx : transactions_)
    {
        if (tx.finished)
            continue;
        tx.finished = true;
        if (tx.on_complete)
            stopped.push_back(std::move(tx.on_complete));
    }
    for (auto& t : timers_)
    {
        t.finished = true;
        t.callback = nullptr;
    }
    gc();

    CADENCE_LOG_DEBUG("stage", "cancelled {} transaction(s)", stopped.size());
    for (auto& cb : stopped)
    {
        cb(false);
    }
}

// ─── Queries ────────────────────────────────────────────────────────────────

bool FrameStage::has_pending_work() const
{
    return active_transactions() > 0 || pending_timers() > 0;
}

size_t FrameStage::active_transactions() const
{
    return static_cast<size_t>(std::count_if(transactions_.begin(),
                                             transactions_.end(),
                                             [](const Transaction& tx) { return !tx.finished; }));
}

size_t FrameStage::pending_timers() const
{
    return static_cast<size_t>(
        std::count_if(timers_.begin(), timers_.end(), [](const Timer& t) { return !t.finished; }));
}

std::vector<FrameStage::TransactionInfo> FrameStage::transactions() const
{
    std::vector<TransactionInfo> out;
    for (const auto& tx : transactions_)
    {
        if (tx.finished)
            continue;
        out.push_back({tx.id, tx.request, tx.elapsed, tx.started});
    }
    return out;
}

void FrameStage::gc()
{
    std::erase_if(transactions_, [](const Transaction& tx) { return tx.finished; });
    std::erase_if(timers_, [](const Timer& t) { return t.finished; });
}

}   // namespace cadence

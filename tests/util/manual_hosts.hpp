#pragma once

// Hand-driven hosts for executor tests.
//
// ManualAnimationHost records every transaction and completes one only when
// the test calls complete(). ManualTimerHost does the same for timers.
// ImmediateAnimationHost completes inside animate(), which exercises the
// executor's handling of synchronous completion signals. ImmediateTimerHost
// does the same for timers by firing inside schedule().

#include <cadence/host.hpp>
#include <cstddef>
#include <functional>
#include <vector>

namespace cadence::test
{

class ManualAnimationHost : public AnimationHost
{
   public:
    struct Record
    {
        AnimationRequest    request;
        Effect              effect;
        AnimationCompletion on_complete;
        bool                completed = false;
    };

    void animate(const AnimationRequest& request,
                 Effect                  effect,
                 AnimationCompletion     on_complete) override
    {
        records.push_back({request, effect, std::move(on_complete), false});
        if (effect)
            effect();
    }

    // Fire the completion of the transaction at `index`.
    void complete(size_t index, bool finished = true)
    {
        auto& r     = records.at(index);
        r.completed = true;
        auto cb     = r.on_complete;
        if (cb)
            cb(finished);
    }

    // Fire the completion again, as a misbehaving host would.
    void complete_again(size_t index, bool finished = true)
    {
        auto cb = records.at(index).on_complete;
        if (cb)
            cb(finished);
    }

    void complete_last(bool finished = true) { complete(records.size() - 1, finished); }

    size_t count() const { return records.size(); }

    std::vector<Record> records;
};

class ImmediateAnimationHost : public AnimationHost
{
   public:
    void animate(const AnimationRequest&, Effect effect, AnimationCompletion on_complete) override
    {
        ++calls;
        if (effect)
            effect();
        if (on_complete)
            on_complete(true);
    }

    size_t calls = 0;
};

class ManualTimerHost : public TimerHost
{
   public:
    struct Record
    {
        TimerId               id;
        float                 timeout;
        std::function<void()> callback;
        bool                  cancelled = false;
        bool                  fired     = false;
    };

    TimerId schedule(float timeout, std::function<void()> callback) override
    {
        TimerId id = next_id_++;
        records.push_back({id, timeout, std::move(callback), false, false});
        return id;
    }

    void cancel(TimerId id) override
    {
        for (auto& r : records)
        {
            if (r.id == id)
                r.cancelled = true;
        }
    }

    // Fire the timer at `index` even if cancelled (simulates a late timer).
    void fire(size_t index)
    {
        auto& r = records.at(index);
        r.fired = true;
        auto cb = r.callback;
        if (cb)
            cb();
    }

    void fire_last() { fire(records.size() - 1); }

    size_t count() const { return records.size(); }

    std::vector<Record> records;

   private:
    TimerId next_id_ = 1;
};

class ImmediateTimerHost : public TimerHost
{
   public:
    TimerId schedule(float, std::function<void()> callback) override
    {
        ++scheduled;
        if (callback)
            callback();
        return next_id_++;
    }

    void cancel(TimerId) override { ++cancels; }

    size_t scheduled = 0;
    size_t cancels   = 0;

   private:
    TimerId next_id_ = 1;
};

}   // namespace cadence::test

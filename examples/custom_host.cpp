#include <cadence/cadence.hpp>
#include <functional>
#include <unordered_set>
#include <utility>
#include <vector>

using namespace cadence;

// Plugging a chain into an application's own run loop. The host below queues
// every transaction and timer and settles them when the loop "ticks", which is
// roughly what a platform animation system does.

namespace
{

class QueueHost : public AnimationHost, public TimerHost
{
   public:
    void animate(const AnimationRequest& request,
                 Effect                  effect,
                 AnimationCompletion     on_complete) override
    {
        CADENCE_LOG_INFO("host", "transaction: {}s after {}s", request.duration, request.delay);
        pending_.push_back(
            [effect = std::move(effect), on_complete = std::move(on_complete)]()
            {
                effect();
                on_complete(true);
            });
    }

    TimerId schedule(float timeout, std::function<void()> callback) override
    {
        CADENCE_LOG_INFO("host", "timer {} in {}s", next_id_, timeout);
        timers_.push_back({next_id_, std::move(callback)});
        return next_id_++;
    }

    void cancel(TimerId id) override
    {
        cancelled_.insert(id);
        for (auto& t : timers_)
        {
            if (t.first == id)
                t.second = nullptr;
        }
    }

    // Settle everything queued so far. Work queued while settling waits for
    // the next tick. Returns false once there is nothing left to do.
    bool tick()
    {
        auto work   = std::move(pending_);
        auto timers = std::move(timers_);
        pending_.clear();
        timers_.clear();

        for (auto& fn : work)
            fn();
        // A callback may cancel a timer that is due in this same tick.
        for (auto& t : timers)
        {
            if (t.second && !cancelled_.contains(t.first))
                t.second();
        }
        cancelled_.clear();
        return !work.empty() || !timers.empty();
    }

   private:
    std::vector<std::function<void()>>                     pending_;
    std::vector<std::pair<TimerId, std::function<void()>>> timers_;
    std::unordered_set<TimerId>                            cancelled_;
    TimerId                                                next_id_ = 1;
};

}   // anonymous namespace

int main()
{
    apply_logging(EngineConfig::from_env());

    QueueHost host;
    int       opacity = 0;

    Animate fade_in;
    fade_in.animate(0.25f, [&opacity] { opacity = 100; });

    Animate chain;
    chain.do_action([] { CADENCE_LOG_INFO("example", "start"); })
        .then(fade_in)
        .wait(1.0f,
              [](ResumeFn resume)
              {
                  CADENCE_LOG_INFO("example", "waiting on an external event");
                  resume();
              })
        .decide([&opacity] { return opacity == 100; })
        .do_action([] { CADENCE_LOG_INFO("example", "fully visible"); });

    auto on_done = [](bool interrupted)
    { CADENCE_LOG_INFO("example", "done, interrupted={}", interrupted); };
    if (!chain.run(host, host, on_done))
        return 1;

    int ticks = 0;
    while (host.tick())
        ++ticks;

    CADENCE_LOG_INFO("example",
                     "settled after {} tick(s), state {}",
                     ticks,
                     chain_state_name(chain.state()));
    return chain.state() == ChainState::Completed ? 0 : 1;
}

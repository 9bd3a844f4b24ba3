#include <cadence/animate.hpp>
#include <cadence/logger.hpp>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace cadence
{

namespace
{

template <typename>
inline constexpr bool always_false_v = false;

}   // anonymous namespace

const char* chain_state_name(ChainState state)
{
    switch (state)
    {
        case ChainState::Idle:
            return "idle";
        case ChainState::Running:
            return "running";
        case ChainState::Completed:
            return "completed";
        case ChainState::Interrupted:
            return "interrupted";
    }
    return "unknown";
}

// Observable part of a run, shared between the Animate and its Execution so the
// builder can be queried (or destroyed) while the chain is in flight.
struct Animate::Progress
{
    ChainState state  = ChainState::Idle;
    size_t     cursor = 0;
};

// ─── Execution ──────────────────────────────────────────────────────────────
//
// One in-flight run. Owns a snapshot of the steps and the cursor. Callbacks
// handed to the hosts hold a shared_ptr to it, so it lives exactly as long as
// something can still resume it.
//
// Each suspending step is tagged with a fresh token. A completion signal only
// advances the chain when it carries the token of the step currently awaited,
// so a wait's timer and its resume handle can race without double-advancing,
// and late signals from a host are harmless.

class Animate::Execution : public std::enable_shared_from_this<Animate::Execution>
{
   public:
    Execution(std::vector<Step>         steps,
              std::shared_ptr<Progress> progress,
              AnimationHost&            animations,
              TimerHost&                timers,
              ChainCompletion           completion)
        : steps_(std::move(steps)),
          progress_(std::move(progress)),
          animations_(animations),
          timers_(timers),
          completion_(std::move(completion))
    {
    }

    void start()
    {
        CADENCE_LOG_DEBUG("animate", "run: {} step(s)", steps_.size());
        pump();
    }

   private:
    using Token = uint64_t;

    // Clears the re-entrancy flag even when an effect throws.
    struct PumpGuard
    {
        bool& flag;
        explicit PumpGuard(bool& f) : flag(f) { flag = true; }
        ~PumpGuard() { flag = false; }
    };

    // Dispatch steps until one suspends or the chain ends. A signal delivered
    // synchronously from inside a host call lands here re-entrantly; it only
    // moves the cursor and the outer loop carries on.
    void pump()
    {
        if (pumping_)
            return;

        auto      keep_alive = shared_from_this();
        PumpGuard guard(pumping_);

        try
        {
            while (!finished_ && awaiting_ == 0)
            {
                if (cursor_ >= steps_.size())
                {
                    finish(false);
                    break;
                }

                progress_->cursor = cursor_;
                if (!dispatch(steps_[cursor_]))
                    break;
            }
        }
        catch (...)
        {
            if (!finished_)
                abandon();
            throw;
        }
    }

    // A step threw: the chain ends Interrupted without calling the completion,
    // and the exception reaches whoever drove the step.
    void abandon()
    {
        CADENCE_LOG_ERROR("animate", "step {} threw, abandoning the chain", cursor_);
        finished_         = true;
        awaiting_         = 0;
        progress_->cursor = cursor_;
        progress_->state  = ChainState::Interrupted;
        completion_       = nullptr;
        if (wait_timer_ != TimerHost::INVALID_TIMER)
        {
            TimerHost::TimerId timer = wait_timer_;
            wait_timer_              = TimerHost::INVALID_TIMER;
            timers_.cancel(timer);
        }
    }

    // Returns false when the chain stopped (decision), true otherwise.
    bool dispatch(const Step& step)
    {
        CADENCE_LOG_TRACE("animate", "step {} ({})", cursor_, step_kind_name(step));

        return std::visit(
            [this](const auto& s) -> bool
            {
                using T = std::decay_t<decltype(s)>;
                if constexpr (std::is_same_v<T, DecisionStep>)
                {
                    if (!s.evaluator())
                    {
                        CADENCE_LOG_DEBUG("animate", "decision at step {} stopped the chain", cursor_);
                        finish(true);
                        return false;
                    }
                    ++cursor_;
                    return true;
                }
                else if constexpr (std::is_same_v<T, ActionStep>)
                {
                    if (target_alive(s.target))
                        s.effect();
                    ++cursor_;
                    return true;
                }
                else if constexpr (std::is_same_v<T, AnimationStep>)
                {
                    if (!target_alive(s.target))
                    {
                        ++cursor_;
                        return true;
                    }
                    begin_animation(s);
                    return true;
                }
                else if constexpr (std::is_same_v<T, WaitStep>)
                {
                    if (!target_alive(s.target))
                    {
                        ++cursor_;
                        return true;
                    }
                    begin_wait(s);
                    return true;
                }
                else
                {
                    static_assert(always_false_v<T>, "unhandled step kind");
                }
            },
            step);
    }

    bool target_alive(const TargetProbe& probe) const
    {
        if (!probe || probe())
            return true;
        CADENCE_LOG_DEBUG("animate", "step {} target is gone, completing it", cursor_);
        return false;
    }

    void begin_animation(const AnimationStep& s)
    {
        Token token = ++last_token_;
        awaiting_   = token;

        AnimationRequest request{.duration = s.duration, .delay = s.delay, .options = s.options};
        auto             self = shared_from_this();
        animations_.animate(request,
                            s.effect,
                            [self, token](bool finished)
                            {
                                if (!finished)
                                {
                                    CADENCE_LOG_DEBUG("animate",
                                                      "animation for token {} was cut short",
                                                      token);
                                }
                                self->signal(token, "animation");
                            });
    }

    void begin_wait(const WaitStep& s)
    {
        Token token = ++last_token_;
        awaiting_   = token;

        auto self   = shared_from_this();
        wait_timer_ = timers_.schedule(s.timeout,
                                       [self, token]() { self->signal(token, "timeout"); });

        // The timer may already have fired synchronously. The effect still
        // runs once; its resume handle is then stale.
        if (awaiting_ != token)
            wait_timer_ = TimerHost::INVALID_TIMER;

        s.effect([self, token]() { self->signal(token, "resume"); });
    }

    void signal(Token token, const char* source)
    {
        if (finished_ || token != awaiting_)
        {
            CADENCE_LOG_DEBUG("animate", "ignoring stale {} signal (token {})", source, token);
            return;
        }

        CADENCE_LOG_TRACE("animate", "step {} done via {}", cursor_, source);
        awaiting_ = 0;
        if (wait_timer_ != TimerHost::INVALID_TIMER)
        {
            TimerHost::TimerId timer = wait_timer_;
            wait_timer_              = TimerHost::INVALID_TIMER;
            timers_.cancel(timer);
        }

        ++cursor_;
        pump();
    }

    void finish(bool interrupted)
    {
        finished_         = true;
        progress_->cursor = cursor_;
        progress_->state  = interrupted ? ChainState::Interrupted : ChainState::Completed;
        CADENCE_LOG_DEBUG("animate", "chain {}", chain_state_name(progress_->state));

        ChainCompletion completion = std::move(completion_);
        completion_                = nullptr;
        if (completion)
            completion(interrupted);
    }

    std::vector<Step>         steps_;
    std::shared_ptr<Progress> progress_;
    AnimationHost&            animations_;
    TimerHost&                timers_;
    ChainCompletion           completion_;

    size_t             cursor_     = 0;
    Token              last_token_ = 0;
    Token              awaiting_   = 0;   // 0 when no step is suspended
    TimerHost::TimerId wait_timer_ = TimerHost::INVALID_TIMER;
    bool               pumping_    = false;
    bool               finished_   = false;
};

// ─── Animate ────────────────────────────────────────────────────────────────

Animate::Animate()  = default;
Animate::~Animate() = default;

Animate::Animate(const Animate& other) : steps_(other.steps_) {}

Animate& Animate::operator=(const Animate& other)
{
    if (this != &other)
    {
        steps_ = other.steps_;
        progress_.reset();
    }
    return *this;
}

Animate::Animate(Animate&& other) noexcept            = default;
Animate& Animate::operator=(Animate&& other) noexcept = default;

void Animate::ensure_mutable() const
{
    if (state() != ChainState::Idle)
    {
        CADENCE_LOG_ERROR("animate", "cannot append to a {} chain", chain_state_name(state()));
        throw std::logic_error("cannot append to a chain that has already been run");
    }
}

Animate& Animate::append(Step step)
{
    ensure_mutable();
    try
    {
        validate_step(step);
    }
    catch (const std::invalid_argument& e)
    {
        CADENCE_LOG_ERROR("animate", "rejected {} step: {}", step_kind_name(step), e.what());
        throw;
    }
    steps_.push_back(std::move(step));
    return *this;
}

Animate& Animate::do_action(Effect effect, TargetProbe target)
{
    return append(ActionStep{std::move(effect), std::move(target)});
}

Animate& Animate::animate(float duration, Effect effect)
{
    return animate(duration, 0.0f, AnimationOptions::None, std::move(effect));
}

Animate& Animate::animate(float duration, float delay, Effect effect)
{
    return animate(duration, delay, AnimationOptions::None, std::move(effect));
}

Animate& Animate::animate(float            duration,
                          float            delay,
                          AnimationOptions options,
                          Effect           effect,
                          TargetProbe      target)
{
    return append(AnimationStep{duration, delay, options, std::move(effect), std::move(target)});
}

Animate& Animate::wait(float timeout, WaitEffect effect, TargetProbe target)
{
    return append(WaitStep{timeout, std::move(effect), std::move(target)});
}

Animate& Animate::decide(DecisionFn evaluator)
{
    return append(DecisionStep{std::move(evaluator)});
}

Animate& Animate::then(const Animate& other)
{
    ensure_mutable();
    // Copy first: `other` may be *this.
    std::vector<Step> incoming = other.steps_;
    steps_.insert(steps_.end(),
                  std::make_move_iterator(incoming.begin()),
                  std::make_move_iterator(incoming.end()));
    return *this;
}

bool Animate::run(AnimationHost& animations, TimerHost& timers, ChainCompletion completion)
{
    if (state() != ChainState::Idle)
    {
        CADENCE_LOG_WARN("animate", "run() rejected: chain is {}", chain_state_name(state()));
        return false;
    }

    progress_        = std::make_shared<Progress>();
    progress_->state = ChainState::Running;

    auto execution = std::make_shared<Execution>(
        steps_, progress_, animations, timers, std::move(completion));
    execution->start();
    return true;
}

ChainState Animate::state() const
{
    return progress_ ? progress_->state : ChainState::Idle;
}

size_t Animate::cursor() const
{
    return progress_ ? progress_->cursor : 0;
}

}   // namespace cadence

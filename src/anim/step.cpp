#include <cadence/step.hpp>
#include <cmath>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace cadence
{

namespace
{

template <typename>
inline constexpr bool always_false_v = false;

void require_time(float value, const char* what, bool allow_zero)
{
    if (!std::isfinite(value))
    {
        throw std::invalid_argument(std::string(what) + " must be finite");
    }
    if (allow_zero ? value < 0.0f : value <= 0.0f)
    {
        throw std::invalid_argument(std::string(what) + (allow_zero ? " must be >= 0, got "
                                                                    : " must be > 0, got ")
                                    + std::to_string(value));
    }
}

}   // anonymous namespace

Timing timing_for(AnimationOptions options)
{
    if (has_option(options, AnimationOptions::CurveLinear))
        return Timing::Linear;

    bool in  = has_option(options, AnimationOptions::CurveEaseIn);
    bool out = has_option(options, AnimationOptions::CurveEaseOut);
    if (in && !out)
        return Timing::EaseIn;
    if (out && !in)
        return Timing::EaseOut;
    return Timing::EaseInOut;
}

const char* step_kind_name(const Step& step)
{
    return std::visit(
        [](const auto& s) -> const char*
        {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, ActionStep>)
                return "action";
            else if constexpr (std::is_same_v<T, AnimationStep>)
                return "animation";
            else if constexpr (std::is_same_v<T, WaitStep>)
                return "wait";
            else if constexpr (std::is_same_v<T, DecisionStep>)
                return "decision";
            else
                static_assert(always_false_v<T>, "unhandled step kind");
        },
        step);
}

void validate_step(const Step& step)
{
    std::visit(
        [](const auto& s)
        {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, ActionStep>)
            {
                if (!s.effect)
                    throw std::invalid_argument("action step needs an effect");
            }
            else if constexpr (std::is_same_v<T, AnimationStep>)
            {
                require_time(s.duration, "animation duration", true);
                require_time(s.delay, "animation delay", true);
                if (!s.effect)
                    throw std::invalid_argument("animation step needs an effect");
            }
            else if constexpr (std::is_same_v<T, WaitStep>)
            {
                require_time(s.timeout, "wait timeout", false);
                if (!s.effect)
                    throw std::invalid_argument("wait step needs an effect");
            }
            else if constexpr (std::is_same_v<T, DecisionStep>)
            {
                if (!s.evaluator)
                    throw std::invalid_argument("decision step needs an evaluator");
            }
            else
            {
                static_assert(always_false_v<T>, "unhandled step kind");
            }
        },
        step);
}

}   // namespace cadence

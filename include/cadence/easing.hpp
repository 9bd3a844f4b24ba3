#pragma once

#include <cstdint>
#include <functional>

namespace cadence
{

namespace ease
{
float linear(float t);
float ease_in(float t);
float ease_out(float t);
float ease_in_out(float t);

// Cubic-bezier easing (CSS / CoreAnimation control points)
struct CubicBezier
{
    float x1, y1, x2, y2;
    float operator()(float t) const;
};

// CoreAnimation media timing presets
inline constexpr CubicBezier ca_ease_in{0.42f, 0.0f, 1.0f, 1.0f};
inline constexpr CubicBezier ca_ease_out{0.0f, 0.0f, 0.58f, 1.0f};
inline constexpr CubicBezier ca_ease_in_out{0.42f, 0.0f, 0.58f, 1.0f};
inline constexpr CubicBezier ca_default{0.25f, 0.1f, 0.25f, 1.0f};
}   // namespace ease

using EasingFunc = std::function<float(float)>;

// Named timing curves for layer-level animations.
enum class Timing : uint8_t
{
    Linear,
    EaseIn,
    EaseOut,
    EaseInOut,
    Default,
};

EasingFunc  easing_for(Timing timing);
const char* timing_name(Timing timing);

}   // namespace cadence

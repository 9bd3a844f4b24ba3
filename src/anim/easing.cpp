#include <algorithm>
#include <cadence/easing.hpp>
#include <cmath>

namespace cadence
{

namespace ease
{

float linear(float t)
{
    return t;
}

float ease_in(float t)
{
    // Cubic ease-in
    return t * t * t;
}

float ease_out(float t)
{
    // Cubic ease-out
    float u = 1.0f - t;
    return 1.0f - u * u * u;
}

float ease_in_out(float t)
{
    if (t < 0.5f)
    {
        return 4.0f * t * t * t;
    }
    float u = -2.0f * t + 2.0f;
    return 1.0f - u * u * u / 2.0f;
}

float CubicBezier::operator()(float t) const
{
    // Newton-Raphson: find u with bezier_x(u) == t, then return bezier_y(u)
    if (t <= 0.0f)
        return 0.0f;
    if (t >= 1.0f)
        return 1.0f;

    float u = t;
    for (int i = 0; i < 8; ++i)
    {
        float u2   = u * u;
        float u3   = u2 * u;
        float inv  = 1.0f - u;
        float inv2 = inv * inv;

        float bx = 3.0f * inv2 * u * x1 + 3.0f * inv * u2 * x2 + u3;
        float dx = 3.0f * inv2 * x1 + 6.0f * inv * u * (x2 - x1) + 3.0f * u2 * (1.0f - x2);

        if (std::abs(dx) < 1e-7f)
            break;
        u -= (bx - t) / dx;
        u = std::clamp(u, 0.0f, 1.0f);
    }

    float inv  = 1.0f - u;
    float inv2 = inv * inv;
    float u2   = u * u;
    return 3.0f * inv2 * u * y1 + 3.0f * inv * u2 * y2 + u2 * u;
}

}   // namespace ease

EasingFunc easing_for(Timing timing)
{
    switch (timing)
    {
        case Timing::Linear:
            return ease::linear;
        case Timing::EaseIn:
            return ease::ca_ease_in;
        case Timing::EaseOut:
            return ease::ca_ease_out;
        case Timing::EaseInOut:
            return ease::ca_ease_in_out;
        case Timing::Default:
            return ease::ca_default;
    }
    return ease::linear;
}

const char* timing_name(Timing timing)
{
    switch (timing)
    {
        case Timing::Linear:
            return "linear";
        case Timing::EaseIn:
            return "easeIn";
        case Timing::EaseOut:
            return "easeOut";
        case Timing::EaseInOut:
            return "easeInOut";
        case Timing::Default:
            return "default";
    }
    return "unknown";
}

}   // namespace cadence

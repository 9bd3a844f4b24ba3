#include <algorithm>
#include <cadence/logger.hpp>
#include <cadence/view_effects.hpp>
#include <cmath>
#include <stdexcept>

namespace cadence
{

namespace
{

void apply_transforms(ViewRegistry* views, ViewId id, const std::vector<Transform>& transforms)
{
    View* v = views->get(id);
    if (!v)
        return;
    if (auto m = compose(transforms))
        v->transform = *m;
}

void apply_color(ViewRegistry* views, ViewId id, Color color)
{
    if (View* v = views->get(id))
        v->background = color;
}

}   // anonymous namespace

ViewEffects::ViewEffects(ViewRegistry& views, LayerAnimator& layers)
    : views_(&views), layers_(&layers)
{
}

TargetProbe ViewEffects::probe(ViewId id) const
{
    return [views = views_, id]() { return views->contains(id); };
}

Animate ViewEffects::animated(ViewId           id,
                              float            duration,
                              float            delay,
                              AnimationOptions options,
                              Effect           effect) const
{
    Animate chain;
    chain.animate(duration, delay, options, std::move(effect), probe(id));
    return chain;
}

// ─── Immediate ──────────────────────────────────────────────────────────────

void ViewEffects::transformed(ViewId id, const std::vector<Transform>& transforms)
{
    apply_transforms(views_, id, transforms);
}

void ViewEffects::move(ViewId id, double x, double y)
{
    transformed(id, {cadence::transform::Move{x, y}});
}

void ViewEffects::rotate(ViewId id, double degrees)
{
    transformed(id, {cadence::transform::Rotate{degrees}});
}

void ViewEffects::scale(ViewId id, double x, double y)
{
    transformed(id, {cadence::transform::Scale{x, y}});
}

void ViewEffects::color(ViewId id, Color color)
{
    apply_color(views_, id, color);
}

// ─── Chain producers ────────────────────────────────────────────────────────

Animate ViewEffects::color(ViewId id, float duration, Color color, float delay, AnimationOptions options)
{
    return animated(id,
                    duration,
                    delay,
                    options,
                    [views = views_, id, color]() { apply_color(views, id, color); });
}

Animate ViewEffects::scale(ViewId           id,
                           float            duration,
                           double           x,
                           double           y,
                           float            delay,
                           AnimationOptions options)
{
    return transform(id, duration, {cadence::transform::Scale{x, y}}, delay, options);
}

Animate ViewEffects::rotate(ViewId id, float duration, double degrees, float delay, AnimationOptions options)
{
    return transform(id, duration, {cadence::transform::Rotate{degrees}}, delay, options);
}

Animate ViewEffects::move(ViewId           id,
                          float            duration,
                          double           x,
                          double           y,
                          float            delay,
                          AnimationOptions options)
{
    return transform(id, duration, {cadence::transform::Move{x, y}}, delay, options);
}

Animate ViewEffects::transform(ViewId                        id,
                               float                         duration,
                               const std::vector<Transform>& transforms,
                               float                         delay,
                               AnimationOptions              options)
{
    return animated(id,
                    duration,
                    delay,
                    options,
                    [views = views_, id, transforms]() { apply_transforms(views, id, transforms); });
}

Animate ViewEffects::corner(ViewId id, float duration, float radius, Timing timing, bool wait)
{
    if (!std::isfinite(duration) || duration < 0.0f)
    {
        CADENCE_LOG_ERROR("views", "corner duration must be >= 0, got {}", duration);
        throw std::invalid_argument("corner duration must be >= 0");
    }

    auto start = [views = views_, layers = layers_, id, duration, radius, timing](
                     LayerAnimator::StopFn on_stop)
    {
        View* v = views->get(id);
        if (!v)
        {
            if (on_stop)
                on_stop(false);
            return;
        }
        v->layer.corner_radius = radius;
        layers->animate_corner_radius(id, radius, duration, timing, std::move(on_stop));
    };

    Animate chain;
    if (wait)
    {
        // The layer animation's stop delegate resumes the chain; the timeout
        // only matters if the animator is never updated.
        chain.wait(
            std::max(duration, MIN_CORNER_TIMEOUT),
            [start](ResumeFn resume) { start([resume](bool) { resume(); }); },
            probe(id));
    }
    else
    {
        chain.do_action([start]() { start({}); }, probe(id));
    }
    return chain;
}

}   // namespace cadence

#include <algorithm>
#include <cadence/layer_animator.hpp>
#include <cadence/logger.hpp>

namespace cadence
{

LayerAnimator::LayerAnimator(ViewRegistry& views) : views_(views) {}

void LayerAnimator::stop(CornerAnim& anim, bool finished, std::vector<std::function<void()>>& stopped)
{
    anim.finished = true;
    if (anim.on_stop)
    {
        stopped.push_back([cb = std::move(anim.on_stop), finished]() { cb(finished); });
        anim.on_stop = nullptr;
    }
}

void LayerAnimator::run_all(std::vector<std::function<void()>>& fns)
{
    for (auto& fn : fns)
    {
        fn();
    }
}

// ─── Animate corner radius ──────────────────────────────────────────────────

LayerAnimator::AnimId LayerAnimator::animate_corner_radius(ViewId view,
                                                           float  to,
                                                           float  duration,
                                                           Timing timing,
                                                           StopFn on_stop)
{
    View* v = views_.get(view);
    if (!v)
    {
        CADENCE_LOG_DEBUG("layer", "corner animation on missing view {}", view);
        if (on_stop)
            on_stop(false);
        return 0;
    }

    std::vector<std::function<void()>> stopped;
    for (auto& a : corner_anims_)
    {
        if (a.view == view && !a.finished)
            stop(a, false, stopped);
    }

    CornerAnim anim;
    anim.id       = next_id_++;
    anim.view     = view;
    anim.start    = v->layer.presentation_corner_radius;
    anim.end      = to;
    anim.duration = std::max(duration, 0.0f);
    anim.easing   = easing_for(timing);
    anim.on_stop  = std::move(on_stop);
    corner_anims_.push_back(std::move(anim));

    AnimId id = corner_anims_.back().id;
    CADENCE_LOG_TRACE("layer",
                      "corner {} on view {}: {} -> {} over {}s ({})",
                      id,
                      view,
                      corner_anims_.back().start,
                      to,
                      duration,
                      timing_name(timing));

    gc();
    run_all(stopped);
    return id;
}

// ─── Cancel ─────────────────────────────────────────────────────────────────

void LayerAnimator::cancel(AnimId id)
{
    std::vector<std::function<void()>> stopped;
    for (auto& a : corner_anims_)
    {
        if (a.id == id && !a.finished)
            stop(a, false, stopped);
    }
    gc();
    run_all(stopped);
}

void LayerAnimator::cancel_for_view(ViewId view)
{
    std::vector<std::function<void()>> stopped;
    for (auto& a : corner_anims_)
    {
        if (a.view == view && !a.finished)
            stop(a, false, stopped);
    }
    gc();
    run_all(stopped);
}

void LayerAnimator::cancel_all()
{
    std::vector<std::function<void()>> stopped;
    for (auto& a : corner_anims_)
    {
        if (!a.finished)
            stop(a, false, stopped);
    }
    gc();
    run_all(stopped);
}

// ─── Update ─────────────────────────────────────────────────────────────────

void LayerAnimator::update(float dt)
{
    if (dt < 0.0f)
        dt = 0.0f;

    std::vector<std::function<void()>> stopped;
    for (auto& a : corner_anims_)
    {
        if (a.finished)
            continue;

        View* v = views_.get(a.view);
        if (!v)
        {
            CADENCE_LOG_DEBUG("layer", "view {} went away mid-animation", a.view);
            stop(a, false, stopped);
            continue;
        }

        a.elapsed += dt;
        float t     = a.duration > 0.0f ? std::clamp(a.elapsed / a.duration, 0.0f, 1.0f) : 1.0f;
        float eased = a.easing(t);

        v->layer.presentation_corner_radius = a.start + (a.end - a.start) * eased;

        if (t >= 1.0f)
        {
            v->layer.presentation_corner_radius = a.end;   // snap to exact target
            stop(a, true, stopped);
        }
    }

    gc();
    run_all(stopped);
}

// ─── Queries ────────────────────────────────────────────────────────────────

bool LayerAnimator::has_active_animations() const
{
    return active_count() > 0;
}

size_t LayerAnimator::active_count() const
{
    return static_cast<size_t>(std::count_if(corner_anims_.begin(),
                                             corner_anims_.end(),
                                             [](const CornerAnim& a) { return !a.finished; }));
}

void LayerAnimator::gc()
{
    std::erase_if(corner_anims_, [](const CornerAnim& a) { return a.finished; });
}

}   // namespace cadence

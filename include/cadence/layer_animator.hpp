#pragma once

#include <cadence/easing.hpp>
#include <cadence/view.hpp>
#include <cstdint>
#include <functional>
#include <vector>

namespace cadence
{

// Layer-level property animations (the CABasicAnimation counterpart).
//
// These run outside the AnimationHost transaction mechanism, so they report
// completion through their own stop delegate. A chain waits on them with a
// wait step whose resume handle is passed as the delegate.
//
// The animator writes presentation values only. Callers set the model value
// themselves, as with CoreAnimation.
//
// Not thread-safe: call from the event-loop thread.
class LayerAnimator
{
   public:
    using AnimId = uint32_t;

    // Fires exactly once: finished == false when stopped early (cancelled,
    // replaced by a newer animation of the same property, or view destroyed).
    using StopFn = std::function<void(bool finished)>;

    explicit LayerAnimator(ViewRegistry& views);

    LayerAnimator(const LayerAnimator&)            = delete;
    LayerAnimator& operator=(const LayerAnimator&) = delete;

    // Animate the presentation corner radius from its current value to `to`.
    // Replaces a running corner animation on the same view.
    // Returns 0 (and stops immediately) if the view does not exist.
    AnimId animate_corner_radius(ViewId view,
                                 float  to,
                                 float  duration,
                                 Timing timing  = Timing::Default,
                                 StopFn on_stop = {});

    void cancel(AnimId id);
    void cancel_for_view(ViewId view);
    void cancel_all();

    // Advance by dt seconds. Stop delegates run after the frame's bookkeeping.
    void update(float dt);

    bool   has_active_animations() const;
    size_t active_count() const;

   private:
    struct CornerAnim
    {
        AnimId     id;
        ViewId     view;
        float      start;
        float      end;
        float      elapsed  = 0.0f;
        float      duration = 0.0f;
        EasingFunc easing;
        StopFn     on_stop;
        bool       finished = false;
    };

    ViewRegistry&           views_;
    AnimId                  next_id_ = 1;
    std::vector<CornerAnim> corner_anims_;

    // Marks the animation finished and hands its delegate to `stopped`.
    static void stop(CornerAnim& anim, bool finished, std::vector<std::function<void()>>& stopped);
    static void run_all(std::vector<std::function<void()>>& fns);

    void gc();
};

}   // namespace cadence

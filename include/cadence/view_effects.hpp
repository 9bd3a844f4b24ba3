#pragma once

#include <cadence/animate.hpp>
#include <cadence/color.hpp>
#include <cadence/layer_animator.hpp>
#include <cadence/view.hpp>
#include <vector>

namespace cadence
{

// Leaf-effect producers for views.
//
// The immediate setters mutate a view now. The producers return single-step
// chains to compose with Animate::then(). Produced effects capture only the
// registry/animator pointers and the view id, and each step carries a
// TargetProbe, so a view destroyed before or during the chain turns the step
// into an instant no-op instead of a dangling access.
//
// The registry and layer animator must outlive every chain produced here.
class ViewEffects
{
   public:
    // Lower bound for a corner wait's timeout when the duration is zero.
    static constexpr float MIN_CORNER_TIMEOUT = 1.0f / 240.0f;

    ViewEffects(ViewRegistry& views, LayerAnimator& layers);

    // ─── Immediate ──────────────────────────────────────────────────────

    // Replace the view's transform with the composition of `transforms`.
    // An empty list leaves the transform unchanged.
    void transformed(ViewId id, const std::vector<Transform>& transforms);
    void move(ViewId id, double x, double y);
    void rotate(ViewId id, double degrees);
    void scale(ViewId id, double x, double y);
    void color(ViewId id, Color color);

    // ─── Chain producers ────────────────────────────────────────────────

    Animate color(ViewId           id,
                  float            duration,
                  Color            color,
                  float            delay   = 0.0f,
                  AnimationOptions options = AnimationOptions::None);

    Animate scale(ViewId           id,
                  float            duration,
                  double           x,
                  double           y,
                  float            delay   = 0.0f,
                  AnimationOptions options = AnimationOptions::None);

    Animate rotate(ViewId           id,
                   float            duration,
                   double           degrees,
                   float            delay   = 0.0f,
                   AnimationOptions options = AnimationOptions::None);

    Animate move(ViewId           id,
                 float            duration,
                 double           x,
                 double           y,
                 float            delay   = 0.0f,
                 AnimationOptions options = AnimationOptions::None);

    Animate transform(ViewId                        id,
                      float                         duration,
                      const std::vector<Transform>& transforms,
                      float                         delay   = 0.0f,
                      AnimationOptions              options = AnimationOptions::None);

    // Corner radius runs as a layer animation, not a transaction. With
    // wait == true the chain holds until the layer animation stops (or the
    // duration elapses); with wait == false it starts it and moves on.
    Animate corner(ViewId id,
                   float  duration,
                   float  radius,
                   Timing timing = Timing::EaseInOut,
                   bool   wait   = true);

    ViewRegistry&  views() const { return *views_; }
    LayerAnimator& layers() const { return *layers_; }

   private:
    ViewRegistry*  views_;
    LayerAnimator* layers_;

    TargetProbe probe(ViewId id) const;
    Animate     animated(ViewId id, float duration, float delay, AnimationOptions options, Effect effect) const;
};

}   // namespace cadence

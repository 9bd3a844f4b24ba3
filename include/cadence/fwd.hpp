#pragma once

#include <cstdint>

namespace cadence
{

using ViewId = uint64_t;

class Animate;
class AnimationHost;
class TimerHost;
class FrameStage;
class FrameClock;
class LayerAnimator;
class ViewRegistry;
class ViewEffects;
class Logger;

struct AnimationRequest;
struct EngineConfig;
struct Frame;
struct View;
struct Layer;
struct Color;
struct Affine2D;

}   // namespace cadence

#pragma once

// Umbrella header: the full public API.

#include <cadence/affine.hpp>
#include <cadence/animate.hpp>
#include <cadence/color.hpp>
#include <cadence/config.hpp>
#include <cadence/easing.hpp>
#include <cadence/frame.hpp>
#include <cadence/frame_clock.hpp>
#include <cadence/frame_stage.hpp>
#include <cadence/fwd.hpp>
#include <cadence/host.hpp>
#include <cadence/layer_animator.hpp>
#include <cadence/logger.hpp>
#include <cadence/step.hpp>
#include <cadence/view.hpp>
#include <cadence/view_effects.hpp>

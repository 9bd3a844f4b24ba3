#pragma once

#include <cadence/frame.hpp>
#include <chrono>
#include <cstdint>

namespace cadence
{

// Wall-clock frame pacing for loops that drive a FrameStage.
//
//   FrameClock clock(60.0f);
//   while (stage.has_pending_work())
//   {
//       clock.begin_frame();
//       stage.update(clock.dt());
//       layers.update(clock.dt());
//       clock.end_frame();   // sleeps to hold the target rate
//   }
class FrameClock
{
   public:
    static constexpr float MAX_DT = 0.25f;   // clamp after stalls (debugger, suspend)

    explicit FrameClock(float target_fps = 60.0f);

    // <= 0 disables pacing (run as fast as possible)
    void  set_target_fps(float fps);
    float target_fps() const { return target_fps_; }

    // Report a constant dt regardless of wall time (deterministic replay).
    void set_fixed_timestep(float dt);
    void clear_fixed_timestep();
    bool has_fixed_timestep() const { return use_fixed_timestep_; }

    void begin_frame();
    void end_frame();

    void reset();

    const Frame& current_frame() const { return frame_; }
    float        dt() const { return frame_.dt; }
    float        elapsed_seconds() const { return frame_.elapsed_sec; }
    uint64_t     frame_number() const { return frame_.number; }

    // Frames whose measured dt exceeded twice the target frame time.
    uint32_t hitch_count() const { return hitch_count_; }

   private:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::duration<double>;

    float target_fps_ = 60.0f;

    bool  use_fixed_timestep_ = false;
    float fixed_dt_           = 1.0f / 60.0f;

    TimePoint start_time_;
    TimePoint frame_start_;
    TimePoint last_frame_start_;
    bool      first_frame_ = true;
    uint32_t  hitch_count_ = 0;

    Frame frame_;
};

}   // namespace cadence

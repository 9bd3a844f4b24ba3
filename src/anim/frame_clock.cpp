#include <cadence/frame_clock.hpp>
#include <cadence/logger.hpp>
#include <thread>

namespace cadence
{

FrameClock::FrameClock(float target_fps)
{
    set_target_fps(target_fps);
    reset();
}

void FrameClock::set_target_fps(float fps)
{
    target_fps_ = fps > 0.0f ? fps : 0.0f;
}

void FrameClock::set_fixed_timestep(float dt)
{
    if (dt <= 0.0f)
    {
        CADENCE_LOG_WARN("clock", "ignoring non-positive fixed timestep {}", dt);
        return;
    }
    use_fixed_timestep_ = true;
    fixed_dt_           = dt;
}

void FrameClock::clear_fixed_timestep()
{
    use_fixed_timestep_ = false;
}

void FrameClock::begin_frame()
{
    frame_start_ = Clock::now();

    if (first_frame_)
    {
        first_frame_       = false;
        start_time_        = frame_start_;
        last_frame_start_  = frame_start_;
        frame_.dt          = use_fixed_timestep_ ? fixed_dt_ : 0.0f;
        frame_.elapsed_sec = 0.0f;
        frame_.number      = 0;
        return;
    }

    Duration since_start = frame_start_ - start_time_;
    Duration since_last  = frame_start_ - last_frame_start_;
    last_frame_start_    = frame_start_;

    float raw_dt = static_cast<float>(since_last.count());
    if (raw_dt > MAX_DT)
        raw_dt = MAX_DT;

    if (target_fps_ > 0.0f && raw_dt > 2.0f / target_fps_)
    {
        ++hitch_count_;
        CADENCE_LOG_DEBUG("clock", "frame {} hitch: {}ms", frame_.number + 1, raw_dt * 1000.0f);
    }

    frame_.dt          = use_fixed_timestep_ ? fixed_dt_ : raw_dt;
    frame_.elapsed_sec = static_cast<float>(since_start.count());
    frame_.number++;
}

void FrameClock::end_frame()
{
    if (target_fps_ <= 0.0f)
        return;

    Duration target_frame_time{1.0 / static_cast<double>(target_fps_)};
    Duration frame_duration = Clock::now() - frame_start_;
    if (frame_duration < target_frame_time)
    {
        std::this_thread::sleep_for(
            std::chrono::duration_cast<std::chrono::microseconds>(target_frame_time - frame_duration));
    }
}

void FrameClock::reset()
{
    first_frame_ = true;
    hitch_count_ = 0;
    frame_       = Frame{};
}

}   // namespace cadence

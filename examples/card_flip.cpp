#include <cadence/cadence.hpp>

using namespace cadence;

// Drives a small card animation in real time: slide in, spin, round the
// corners (waiting on the layer animation), then a conditional color flash.
//
//   CADENCE_LOG_LEVEL=debug ./card_flip
//   CADENCE_LOG_CATEGORIES=animate=trace ./card_flip
//   CADENCE_FIXED_DT=0.0166 CADENCE_TARGET_FPS=0 ./card_flip   # as fast as possible

int main()
{
    EngineConfig config = EngineConfig::from_env();
    apply_logging(config);

    ViewRegistry  views;
    LayerAnimator layers(views);
    ViewEffects   effects(views, layers);
    FrameStage    stage(config.max_frame_dt);

    ViewId card = views.create("card");
    effects.color(card, colors::white);

    bool highlight = true;

    Animate chain;
    chain.do_action([] { CADENCE_LOG_INFO("example", "card flip starting"); })
        .then(effects.move(card, 0.4f, 120.0, 0.0, 0.0f, AnimationOptions::CurveEaseOut))
        .then(effects.rotate(card, 0.3f, 180.0))
        .then(effects.corner(card, 0.5f, 16.0f))
        .decide([&highlight] { return highlight; })
        .then(effects.color(card, 0.2f, colors::orange))
        .then(effects.transform(card,
                                0.3f,
                                {transform::Move{120.0, 0.0}, transform::Scale{1.2, 1.2}},
                                0.1f));

    bool finished = false;
    chain.run(stage,
              stage,
              [&finished](bool interrupted)
              {
                  CADENCE_LOG_INFO("example", "chain done (interrupted={})", interrupted);
                  finished = true;
              });

    FrameClock clock(config.target_fps);
    if (config.fixed_timestep > 0.0f)
        clock.set_fixed_timestep(config.fixed_timestep);

    while (!finished)
    {
        clock.begin_frame();
        stage.update(clock.dt());
        layers.update(clock.dt());
        clock.end_frame();
    }

    const View* v = views.get(card);
    Point       p = v->transform.apply({0.0, 0.0});
    CADENCE_LOG_INFO("example",
                     "{} frames, origin at ({}, {}), corner radius {}",
                     clock.frame_number(),
                     p.x,
                     p.y,
                     v->layer.presentation_corner_radius);
    return 0;
}

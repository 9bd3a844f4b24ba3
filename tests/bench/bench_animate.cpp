#include <benchmark/benchmark.h>
#include <cadence/animate.hpp>
#include <cadence/frame_stage.hpp>
#include <cadence/logger.hpp>
#include <cadence/view_effects.hpp>
#include <vector>

using namespace cadence;

namespace
{

struct QuietLogger
{
    QuietLogger() { Logger::instance().set_level(LogLevel::Off); }
};

const QuietLogger quiet_logger;

}   // anonymous namespace

// ─── Builder benchmarks ──────────────────────────────────────────────────────

static void BM_BuildChain(benchmark::State& state)
{
    const int steps = static_cast<int>(state.range(0));
    for (auto _ : state)
    {
        Animate chain;
        for (int i = 0; i < steps; ++i)
        {
            chain.do_action([] {}).animate(0.25f, [] {});
        }
        benchmark::DoNotOptimize(chain.size());
    }
    state.SetItemsProcessed(state.iterations() * steps * 2);
}
BENCHMARK(BM_BuildChain)->Arg(8)->Arg(64)->Arg(512)->Unit(benchmark::kMicrosecond);

static void BM_ThenConcatenation(benchmark::State& state)
{
    Animate part;
    for (int i = 0; i < 16; ++i)
        part.do_action([] {});

    for (auto _ : state)
    {
        Animate chain;
        for (int i = 0; i < 16; ++i)
            chain.then(part);
        benchmark::DoNotOptimize(chain.size());
    }
}
BENCHMARK(BM_ThenConcatenation)->Unit(benchmark::kMicrosecond);

// ─── Execution benchmarks ────────────────────────────────────────────────────

static void BM_RunActionChain(benchmark::State& state)
{
    const int steps   = static_cast<int>(state.range(0));
    int       counter = 0;

    Animate chain;
    for (int i = 0; i < steps; ++i)
        chain.do_action([&counter] { ++counter; });

    FrameStage stage;
    for (auto _ : state)
    {
        Animate run = chain;
        run.run(stage, stage);
        benchmark::DoNotOptimize(counter);
    }
    state.SetItemsProcessed(state.iterations() * steps);
}
BENCHMARK(BM_RunActionChain)->Arg(16)->Arg(256)->Arg(4096)->Unit(benchmark::kMicrosecond);

static void BM_RunAnimationChainOnStage(benchmark::State& state)
{
    const int steps = static_cast<int>(state.range(0));

    Animate chain;
    for (int i = 0; i < steps; ++i)
        chain.animate(0.0f, [] {});

    for (auto _ : state)
    {
        FrameStage stage;
        Animate    run = chain;
        run.run(stage, stage);
        while (stage.has_pending_work())
            stage.update(1.0f / 60.0f);
        benchmark::DoNotOptimize(run.state());
    }
    state.SetItemsProcessed(state.iterations() * steps);
}
BENCHMARK(BM_RunAnimationChainOnStage)->Arg(16)->Arg(256)->Unit(benchmark::kMicrosecond);

static void BM_ManyConcurrentChains(benchmark::State& state)
{
    const int chains = static_cast<int>(state.range(0));

    ViewRegistry  views;
    LayerAnimator layers(views);
    ViewEffects   effects(views, layers);
    ViewId        card = views.create("card");

    for (auto _ : state)
    {
        FrameStage           stage;
        std::vector<Animate> running;
        running.reserve(static_cast<size_t>(chains));
        for (int i = 0; i < chains; ++i)
        {
            Animate chain;
            chain.then(effects.move(card, 0.25f, 10.0, 0.0))
                .then(effects.rotate(card, 0.25f, 45.0))
                .then(effects.color(card, 0.25f, colors::red));
            running.push_back(chain);
            running.back().run(stage, stage);
        }
        stage.run_until_idle(1.0f / 60.0f);
        benchmark::DoNotOptimize(views.get(card));
    }
    state.SetItemsProcessed(state.iterations() * chains);
}
BENCHMARK(BM_ManyConcurrentChains)->Arg(10)->Arg(100)->Unit(benchmark::kMillisecond);

// ─── FrameStage benchmarks ───────────────────────────────────────────────────

static void BM_StageUpdate(benchmark::State& state)
{
    const int  pending = static_cast<int>(state.range(0));
    FrameStage stage;
    for (int i = 0; i < pending; ++i)
    {
        stage.animate({.duration = 1.0e6f}, [] {}, [](bool) {});
        stage.schedule(1.0e6f, [] {});
    }

    for (auto _ : state)
    {
        stage.update(1.0f / 60.0f);
        benchmark::DoNotOptimize(stage.now());
    }
}
BENCHMARK(BM_StageUpdate)->Arg(10)->Arg(1000)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();

#include <loopsim/core/idle_coordinator.hpp>
#include <loopsim/core/loop.hpp>
#include <loopsim/core/loop_thread.hpp>
#include <loopsim/core/message.hpp>
#include <loopsim/core/message_queue.hpp>
#include <loopsim/core/types.hpp>
#include <loopsim/core/virtual_clock.hpp>

#include <benchmark/benchmark.h>

using namespace loopsim::core;

// ---------------------------------------------------------------------------
// BM_QueueEnqueueDrain: admit N timed messages, then drain them all
// ---------------------------------------------------------------------------

static void BM_QueueEnqueueDrain(benchmark::State& state) {
    const int64_t n = state.range(0);

    for (auto _ : state) {
        state.PauseTiming();
        VirtualClock clock;
        MessageQueue queue(true, clock, "bench");
        int fired = 0;
        state.ResumeTiming();

        for (int64_t i = 0; i < n; ++i) {
            Message message;
            message.when = time_from_millis((i * 7919) % n);
            message.callback = [&fired]() { ++fired; };
            queue.enqueue(std::move(message));
        }
        clock.advance_by(duration_from_millis(n));
        IdleCoordinator coordinator(queue);
        coordinator.drain();
        benchmark::DoNotOptimize(fired);
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(BM_QueueEnqueueDrain)->Arg(1000)->Arg(10000);

// ---------------------------------------------------------------------------
// BM_FrontLaneInterleave: alternate front and timed admissions
// ---------------------------------------------------------------------------

static void BM_FrontLaneInterleave(benchmark::State& state) {
    const int64_t n = state.range(0);

    for (auto _ : state) {
        state.PauseTiming();
        VirtualClock clock;
        MessageQueue queue(true, clock, "bench");
        state.ResumeTiming();

        for (int64_t i = 0; i < n; ++i) {
            Message message;
            message.when = time_from_millis(i);
            queue.enqueue(std::move(message), i % 2 == 0);
        }
        while (auto message = queue.poll_ready()) {
            benchmark::DoNotOptimize(message->sequence);
        }
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(BM_FrontLaneInterleave)->Arg(1000);

// ---------------------------------------------------------------------------
// BM_CrossThreadIdle: hand an idle request to a LoopThread and wait for it
// ---------------------------------------------------------------------------

static void BM_CrossThreadIdle(benchmark::State& state) {
    LoopThread worker("bench-worker");
    const auto& loop = worker.loop();
    int fired = 0;

    for (auto _ : state) {
        loop->post([&fired]() { ++fired; });
        loop->idle();
    }
    benchmark::DoNotOptimize(fired);
}
BENCHMARK(BM_CrossThreadIdle);

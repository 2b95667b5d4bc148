#include <benchmark/benchmark.h>
#include <ripple/ripple.hpp>
#include <latch>
#include <vector>

using namespace ripple;

static void BM_publish_fanout(benchmark::State& state) {
  publish_subject<int> subj;
  volatile int sink = 0;

  std::vector<disposable> subs;
  for (int i = 0; i < state.range(1); ++i) {
    subs.push_back(subj.as_observable().subscribe([&](const int& x){
      sink = x;
      benchmark::DoNotOptimize(sink);
    }));
  }

  for (auto _ : state) {
    for (int i = 0; i < state.range(0); ++i) {
      benchmark::DoNotOptimize(i);
      subj.on_next(i);
    }
  }
}
BENCHMARK(BM_publish_fanout)->Args({1000, 1})->Args({1000, 8})->Args({10000, 8});

static void BM_replay_subscribe(benchmark::State& state) {
  auto subj = replay_subject<int>::create(static_cast<std::size_t>(state.range(0)));
  for (int i = 0; i < state.range(0); ++i) subj.on_next(i);
  volatile int sink = 0;

  for (auto _ : state) {
    auto sub = subj.as_observable().subscribe([&](const int& x){
      sink = x;
      benchmark::DoNotOptimize(sink);
    });
  }
}
BENCHMARK(BM_replay_subscribe)->Arg(1)->Arg(100)->Arg(1000);

static void BM_behavior_next(benchmark::State& state) {
  behavior_subject<int> subj(0);
  volatile int sink = 0;
  auto sub = subj.as_observable().subscribe([&](const int& x){
    sink = x;
    benchmark::DoNotOptimize(sink);
  });

  for (auto _ : state) {
    for (int i = 0; i < state.range(0); ++i) subj.on_next(i);
  }
}
BENCHMARK(BM_behavior_next)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_observe_on_pool(benchmark::State& state) {
  concurrent_scheduler pool{2};

  for (auto _ : state) {
    publish_subject<int> subj;
    std::latch done(1);
    volatile int sink = 0;
    auto sub = (subj.as_observable() | observe_on(pool)).subscribe(
      [&](const int& x){
        sink = x;
        benchmark::DoNotOptimize(sink);
      },
      nullptr,
      [&]{ done.count_down(); });

    for (int i = 0; i < state.range(0); ++i) subj.on_next(i);
    subj.on_completed();
    done.wait();
  }
}
BENCHMARK(BM_observe_on_pool)->Arg(100)->Arg(1000)->Arg(10000);

BENCHMARK_MAIN();

#include <atomic>
#include <benchmark/benchmark.h>
#include <sonar/helpers/mpsc_ring_buffer.hpp>
#include <sonar/sonar_records.hpp>
#include <thread>
#include <vector>

using Sonar::detail::MpscRingBuffer;

namespace {

constexpr size_t kQueueCapacity = 2048;

Sonar::SpanData sample_span(uint64_t n) {
  Sonar::SpanData span;
  span.name = "db.query";
  span.kind = Sonar::SpanKind::kClient;
  span.span_id.bytes[0] = static_cast<uint8_t>(n);
  span.start_time_unix_nano = n;
  span.end_time_unix_nano = n + 1000;
  span.tags = {{"db.system", "postgresql"}, {"db.rows", "12"}};
  return span;
}

} // namespace

/**
 * @brief Enqueue immediately followed by dequeue on one thread.
 *
 * Baseline cost of moving one finished span through the queue with no
 * contention. items_per_second is the number to watch.
 */
static void BM_Queue_SpanEnqueueDequeue(benchmark::State &state) {
  MpscRingBuffer<Sonar::SpanData> queue(kQueueCapacity);
  const auto prototype = sample_span(1);
  Sonar::SpanData out;
  for (auto _ : state) {
    if (!queue.try_emplace(prototype)) {
      state.SkipWithError("queue unexpectedly full");
      break;
    }
    if (!queue.try_pop(out)) {
      state.SkipWithError("queue unexpectedly empty");
      break;
    }
    benchmark::DoNotOptimize(out);
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Queue_SpanEnqueueDequeue);

/**
 * @brief Cost of rejecting an item on a full queue.
 *
 * This is the path instrumentation takes when the exporter falls behind, so
 * it must stay cheap.
 */
static void BM_Queue_RejectWhenFull(benchmark::State &state) {
  MpscRingBuffer<uint64_t> queue(64);
  while (queue.try_emplace(uint64_t{0})) {
  }
  uint64_t value = 0;
  for (auto _ : state) {
    benchmark::DoNotOptimize(queue.try_emplace(value++));
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Queue_RejectWhenFull);

/**
 * @brief Several producers against one draining consumer.
 *
 * The argument is the producer count. Producers spin on a full queue here,
 * unlike the pipeline which drops, so the figure is raw transfer throughput.
 * Expect sublinear scaling; a drop as producers are added points at tail
 * contention.
 */
static void BM_Queue_MultiProducer(benchmark::State &state) {
  const int producers = static_cast<int>(state.range(0));
  constexpr uint64_t kPerProducer = 20000;
  const uint64_t total = kPerProducer * static_cast<uint64_t>(producers);

  for (auto _ : state) {
    MpscRingBuffer<uint64_t> queue(kQueueCapacity);
    std::vector<std::thread> threads;
    threads.reserve(producers);
    for (int p = 0; p < producers; ++p) {
      threads.emplace_back([&queue, p] {
        for (uint64_t i = 0; i < kPerProducer; ++i) {
          const uint64_t value = (static_cast<uint64_t>(p) << 32) | i;
          while (!queue.try_emplace(value)) {
            std::this_thread::yield();
          }
        }
      });
    }

    uint64_t consumed = 0;
    uint64_t value = 0;
    while (consumed < total) {
      if (queue.try_pop(value)) {
        benchmark::DoNotOptimize(value);
        ++consumed;
      } else {
        std::this_thread::yield();
      }
    }
    for (auto &t : threads) {
      t.join();
    }
  }
  state.SetItemsProcessed(state.iterations() * total);
}
BENCHMARK(BM_Queue_MultiProducer)
    ->Arg(1)
    ->Arg(2)
    ->Arg(4)
    ->Arg(8)
    ->Unit(benchmark::kMillisecond)
    ->UseRealTime();

#include <benchmark/benchmark.h>
#include <chrono>
#include <memory>
#include <sonar/sonar.hpp>
#include <sonar/sonar_logging.hpp>
#include <spdlog/logger.h>

namespace {

// Accepts every batch without doing anything with it.
class DiscardingExporter : public Sonar::Exporter {
public:
  Sonar::ExportResult
  export_spans(const std::vector<Sonar::SpanData> &spans) override {
    benchmark::DoNotOptimize(spans.data());
    return Sonar::ExportResult::kSuccess;
  }

  Sonar::ExportResult
  export_logs(const std::vector<Sonar::LogRecord> &logs) override {
    benchmark::DoNotOptimize(logs.data());
    return Sonar::ExportResult::kSuccess;
  }
};

Sonar::Options bench_options() {
  Sonar::Options options;
  options.service_name = "sonar-bench";
  options.max_queue_size = 1 << 16;
  options.max_export_batch_size = 512;
  options.schedule_delay = std::chrono::milliseconds(50);
  options.internal_log_level = "error";
  return options;
}

// Setup hooks cannot fail a run; each benchmark checks is_initialized().
void setup_discarding(const benchmark::State &) {
  if (auto error = Sonar::initialize(bench_options(),
                                     std::make_unique<DiscardingExporter>())) {
    Sonar::logging::internal_logger()->error("Benchmark setup failed: {}",
                                             error->message);
  }
}

void setup_warning_filter(const benchmark::State &) {
  auto options = bench_options();
  options.min_severity = Sonar::Severity::kWarning;
  if (auto error = Sonar::initialize(options,
                                     std::make_unique<DiscardingExporter>())) {
    Sonar::logging::internal_logger()->error("Benchmark setup failed: {}",
                                             error->message);
  }
}

void teardown(const benchmark::State &) { Sonar::shutdown(); }

} // namespace

// Start and stop a root span. Includes id generation, the context stack push
// and pop, and the enqueue.
static void BM_Span_StartStop(benchmark::State &state) {
  if (!Sonar::is_initialized()) {
    state.SkipWithError("Sonar is not initialized");
    return;
  }
  for (auto _ : state) {
    auto span = Sonar::start_span("request", Sonar::SpanKind::kServer);
    span.end();
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Span_StartStop)
    ->Setup(setup_discarding)
    ->Teardown(teardown)
    ->Threads(1)
    ->Threads(4);

static void BM_Span_NestedWithTags(benchmark::State &state) {
  if (!Sonar::is_initialized()) {
    state.SkipWithError("Sonar is not initialized");
    return;
  }
  for (auto _ : state) {
    SONAR_SPAN("outer");
    auto inner = Sonar::start_span("inner", Sonar::SpanKind::kClient);
    inner.set_tag("http.method", "GET");
    inner.set_tag("http.status_code", "200");
    inner.end();
  }
  state.SetItemsProcessed(state.iterations() * 2);
}
BENCHMARK(BM_Span_NestedWithTags)->Setup(setup_discarding)->Teardown(teardown);

// write_log inside an open span, so every record is correlated.
static void BM_Log_Correlated(benchmark::State &state) {
  if (!Sonar::is_initialized()) {
    state.SkipWithError("Sonar is not initialized");
    return;
  }
  auto span = Sonar::start_span("handler");
  for (auto _ : state) {
    Sonar::write_log("cache miss", Sonar::Severity::kDebug);
  }
  span.end();
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Log_Correlated)->Setup(setup_discarding)->Teardown(teardown);

// Records under min_severity are discarded before they reach the queue.
static void BM_Log_Filtered(benchmark::State &state) {
  if (!Sonar::is_initialized()) {
    state.SkipWithError("Sonar is not initialized");
    return;
  }
  for (auto _ : state) {
    Sonar::write_log("noisy", Sonar::Severity::kTrace);
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Log_Filtered)
    ->Setup(setup_warning_filter)
    ->Teardown(teardown);
